//------------------------------------------------------------------------------
// main.cpp
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//
// shaderstager-inspect: lists the shader binaries a directory would turn into
// pipeline stages, without creating a Vulkan device
//------------------------------------------------------------------------------

#include "ShaderStager/Core/Base.hpp"
#include "ShaderStager/Core/Logger/Logger.hpp"
#include "ShaderStager/Core/Logger/ConsoleLogger.hpp"
#include "ShaderStager/Core/Logger/FileLogger.hpp"
#include "ShaderStager/Tools/Inspect/InspectCommand.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
	using namespace ShaderStager;

	std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

	std::optional<InspectOptions> options = ParseInspectArguments(args, std::cerr);
	if (!options)
	{
		PrintInspectUsage(argc > 0 ? argv[0] : "shaderstager-inspect", std::cerr);
		return kInspectExitUsage;
	}

	Logger& logger = Logger::Get();
	logger.AddSink(std::make_shared<ConsoleLogger>(options->useColors));
	logger.SetLogLevel(options->logLevel);

	if (!options->logFile.empty())
	{
		try
		{
			logger.AddSink(std::make_shared<FileLogger>(options->logFile));
		}
		catch (const std::runtime_error& e)
		{
			LOG_ERROR("{}", e.what());
			logger.ClearSinks();
			return kInspectExitFailure;
		}
	}

	LOG_DEBUG("shaderstager-inspect {}.{}.{}",
		SHADERSTAGER_VERSION_MAJOR,
		SHADERSTAGER_VERSION_MINOR,
		SHADERSTAGER_VERSION_PATCH);

	int exitCode = RunInspect(*options, std::cout);

	logger.ClearSinks();
	return exitCode;
}
