//------------------------------------------------------------------------------
// FileLogger.hpp
//
// File output sink for logging system
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "Logger.hpp"
#include <fstream>

namespace ShaderStager
{
	class FileLogger : public ILogSink
	{
	public:
		// Appends to filename, throws std::runtime_error if it cannot be opened
		explicit FileLogger(const std::string& filename);
		virtual ~FileLogger();

		virtual void Write(LogLevel level, const std::string& message) override;

		bool IsOpen() const { return m_File.is_open(); }

	private:
		std::ofstream m_File;
		std::mutex m_FileMutex;
	};
}
