//------------------------------------------------------------------------------
// FileLogger.cpp
//
// File output implementation
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include "FileLogger.hpp"

#include <stdexcept>

namespace ShaderStager
{
	FileLogger::FileLogger(const std::string& filename)
	{
		m_File.open(filename, std::ios::app);
		if (!m_File.is_open())
		{
			throw std::runtime_error("Failed to open log file: " + filename);
		}
	}

	FileLogger::~FileLogger()
	{
		if (m_File.is_open())
		{
			m_File.close();
		}
	}

	void FileLogger::Write(LogLevel level, const std::string& message)
	{
		(void)level;
		std::lock_guard<std::mutex> lock(m_FileMutex);

		if (!m_File.is_open())
			return;

		m_File << message << '\n';
		m_File.flush();
	}
}
