//------------------------------------------------------------------------------
// InspectCommand.hpp
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//
// Argument parsing and classification behind shaderstager-inspect
//------------------------------------------------------------------------------

#pragma once

#include "ShaderStager/Core/Logger/Logger.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace ShaderStager
{
	constexpr int kInspectExitOk = 0;
	constexpr int kInspectExitFailure = 1;
	constexpr int kInspectExitUsage = 2;

	struct InspectOptions
	{
		std::string directory;
		std::string logFile;
		LogLevel logLevel = LogLevel::Warn;
		bool useColors = true;
	};

	// args excludes the program name. Problems are written to err; nullopt means usage error.
	std::optional<InspectOptions> ParseInspectArguments(const std::vector<std::string>& args, std::ostream& err);

	void PrintInspectUsage(const std::string& program, std::ostream& err);

	// Writes "<stage>\t<path>" per shader binary to out.
	// Returns kInspectExitOk when every file was classified, kInspectExitFailure otherwise.
	int RunInspect(const InspectOptions& options, std::ostream& out);
}
