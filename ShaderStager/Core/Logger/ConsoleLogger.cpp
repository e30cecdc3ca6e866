//------------------------------------------------------------------------------
// ConsoleLogger.cpp
//
// Console output implementation with color support
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include "ConsoleLogger.hpp"
#include <iostream>

#ifdef SHADERSTAGER_PLATFORM_WINDOWS
	#ifndef NOMINMAX
	#define NOMINMAX
	#endif
	#include <windows.h>
#endif

namespace ShaderStager
{
	ConsoleLogger::ConsoleLogger(bool useColors)
		: m_UseColors(useColors)
	{
	}

	void ConsoleLogger::Write(LogLevel level, const std::string& message)
	{
		std::ostream& stream = (level >= LogLevel::Warn) ? std::cerr : std::cout;

		if (m_UseColors)
			SetConsoleColor(stream, level);

		stream << message;

		if (m_UseColors)
			ResetConsoleColor(stream);

		stream << std::endl;
	}

	void ConsoleLogger::SetConsoleColor(std::ostream& stream, LogLevel level)
	{
#ifdef SHADERSTAGER_PLATFORM_WINDOWS
		(void)stream;
		HANDLE hConsole = GetStdHandle(level >= LogLevel::Warn ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
		WORD color;

		switch (level)
		{
		case LogLevel::Trace:
			color = FOREGROUND_INTENSITY; //Gray
			break;
		case LogLevel::Debug:
			color = FOREGROUND_GREEN | FOREGROUND_BLUE; // Cyan
			break;
		case LogLevel::Warn:
			color = FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_INTENSITY; // Yellow
			break;
		case LogLevel::Error:
			color = FOREGROUND_RED | FOREGROUND_INTENSITY; // Red
			break;
		default:
			color = FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE;
			break;
		}

		SetConsoleTextAttribute(hConsole, color);
#else
		switch (level)
		{
		case LogLevel::Trace:
			stream << "\033[90m"; // Gray
			break;
		case LogLevel::Debug:
			stream << "\033[36m"; // Cyan
			break;
		case LogLevel::Info:
			stream << "\033[37m"; // White
			break;
		case LogLevel::Warn:
			stream << "\033[33m"; // Yellow
			break;
		case LogLevel::Error:
			stream << "\033[91m"; // Red
			break;
		default:
			break;
		}
#endif
	}

	void ConsoleLogger::ResetConsoleColor(std::ostream& stream)
	{
#ifdef SHADERSTAGER_PLATFORM_WINDOWS
		(void)stream;
		SetConsoleTextAttribute(GetStdHandle(STD_OUTPUT_HANDLE), FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
		SetConsoleTextAttribute(GetStdHandle(STD_ERROR_HANDLE), FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
#else
		stream << "\033[0m";
#endif
	}
}
