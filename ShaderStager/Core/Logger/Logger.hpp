//------------------------------------------------------------------------------
// Logger.hpp
//
// Core logging system for ShaderStager
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <vector>
#include <mutex>
#include <optional>
#include <format>

namespace ShaderStager
{
	enum class LogLevel
	{
		Trace,
		Debug,
		Info,
		Warn,
		Error,
		None
	};

	const char* LogLevelToString(LogLevel level);

	// Accepts the lowercase names used on the command line ("trace" ... "error", "none")
	std::optional<LogLevel> ParseLogLevel(std::string_view name);

	class ILogSink;

	// a singleton logger class that will handle logging messages
	class Logger
	{
	public:

		// singleton instance access
		static Logger& Get();

		// config
		void SetLogLevel(LogLevel level);
		LogLevel GetLogLevel() const { return m_MinLogLevel; }
		void AddSink(std::shared_ptr<ILogSink> sink);
		void ClearSinks();

		// Core Logging Function
		void Log(LogLevel level, const std::string& message);

		//Formatted logging
		template<typename... Args>
		void LogFormatted(LogLevel level, std::format_string<Args...> format, Args&&... args)
		{
			if (level < m_MinLogLevel)
				return;

			Log(level, std::format(format, std::forward<Args>(args)...));
		}

	private:
		Logger() = default;
		~Logger() = default;
		Logger(const Logger&) = delete;
		Logger& operator=(const Logger&) = delete;

		LogLevel m_MinLogLevel = LogLevel::Info;
		std::vector<std::shared_ptr<ILogSink>> m_Sinks;
		std::mutex m_Mutex;
	};

	// sink interface for logging
	class ILogSink
	{
	public:
		virtual ~ILogSink() = default;
		virtual void Write(LogLevel level, const std::string& message) = 0;
	};
}

// Convenience macros for logging
#define LOG_TRACE(...) ::ShaderStager::Logger::Get().LogFormatted(::ShaderStager::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::ShaderStager::Logger::Get().LogFormatted(::ShaderStager::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)  ::ShaderStager::Logger::Get().LogFormatted(::ShaderStager::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)  ::ShaderStager::Logger::Get().LogFormatted(::ShaderStager::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::ShaderStager::Logger::Get().LogFormatted(::ShaderStager::LogLevel::Error, __VA_ARGS__)
