//------------------------------------------------------------------------------
// ConsoleLogger.hpp
//
// Console output sink for logging system
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "Logger.hpp"
#include <iosfwd>

namespace ShaderStager
{
	// Trace/Debug/Info go to stdout, Warn/Error to stderr
	class ConsoleLogger : public ILogSink
	{
	public:
		explicit ConsoleLogger(bool useColors = true);
		virtual ~ConsoleLogger() = default;

		virtual void Write(LogLevel level, const std::string& message) override;

	private:
		bool m_UseColors;

		//Platform-specific color handling
		void SetConsoleColor(std::ostream& stream, LogLevel level);
		void ResetConsoleColor(std::ostream& stream);
	};
}
