//------------------------------------------------------------------------------
// Logger.cpp
//
// Core logging system implementation
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include "ShaderStager/Core/Logger/Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ShaderStager
{
	const char* LogLevelToString(LogLevel level)
	{
		switch (level)
		{
		case LogLevel::Trace: return "TRACE";
		case LogLevel::Debug: return "DEBUG";
		case LogLevel::Info: return "INFO";
		case LogLevel::Warn: return "WARN";
		case LogLevel::Error: return "ERROR";
		case LogLevel::None: return "NONE";
		default: return "UNKNOWN";
		}
	}

	std::optional<LogLevel> ParseLogLevel(std::string_view name)
	{
		if (name == "trace") return LogLevel::Trace;
		if (name == "debug") return LogLevel::Debug;
		if (name == "info") return LogLevel::Info;
		if (name == "warn") return LogLevel::Warn;
		if (name == "error") return LogLevel::Error;
		if (name == "none") return LogLevel::None;
		return std::nullopt;
	}

	Logger& Logger::Get()
	{
		static Logger instance;
		return instance;
	}

	void Logger::SetLogLevel(LogLevel level)
	{
		std::lock_guard<std::mutex> lock(m_Mutex);
		m_MinLogLevel = level;
	}

	void Logger::AddSink(std::shared_ptr<ILogSink> sink)
	{
		std::lock_guard<std::mutex> lock(m_Mutex);
		m_Sinks.push_back(std::move(sink));
	}

	void Logger::ClearSinks()
	{
		std::lock_guard<std::mutex> lock(m_Mutex);
		m_Sinks.clear();
	}

	void Logger::Log(LogLevel level, const std::string& message)
	{
		if (level < m_MinLogLevel || level == LogLevel::None)
			return;

		// Get timestamp
		auto now = std::chrono::system_clock::now();
		auto time_t = std::chrono::system_clock::to_time_t(now);

		std::stringstream ss;
		ss << std::put_time(std::localtime(&time_t), "%H:%M:%S");

		std::string fullMessage = std::format("[{}] [{}] {}", ss.str(), LogLevelToString(level), message);

		// Send to all sinks
		std::lock_guard<std::mutex> lock(m_Mutex);
		for (const auto& sink : m_Sinks)
		{
			sink->Write(level, fullMessage);
		}
	}
}
