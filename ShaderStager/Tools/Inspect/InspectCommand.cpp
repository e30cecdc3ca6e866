//------------------------------------------------------------------------------
// InspectCommand.cpp
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include "ShaderStager/Tools/Inspect/InspectCommand.hpp"
#include "ShaderStager/Shaders/ShaderDirectoryScanner.hpp"

#include <filesystem>
#include <ostream>
#include <stdexcept>

namespace ShaderStager
{
	std::optional<InspectOptions> ParseInspectArguments(const std::vector<std::string>& args, std::ostream& err)
	{
		InspectOptions options;

		for (size_t i = 0; i < args.size(); ++i)
		{
			const std::string& arg = args[i];

			if (arg == "--log-level")
			{
				if (i + 1 >= args.size())
				{
					err << "--log-level needs a value\n";
					return std::nullopt;
				}

				std::optional<LogLevel> level = ParseLogLevel(args[++i]);
				if (!level)
				{
					err << "Unknown log level: " << args[i] << "\n";
					return std::nullopt;
				}
				options.logLevel = *level;
			}
			else if (arg == "--log-file")
			{
				if (i + 1 >= args.size())
				{
					err << "--log-file needs a path\n";
					return std::nullopt;
				}
				options.logFile = args[++i];
			}
			else if (arg == "--no-color")
			{
				options.useColors = false;
			}
			else if (!arg.empty() && arg.front() == '-')
			{
				err << "Unknown option: " << arg << "\n";
				return std::nullopt;
			}
			else if (options.directory.empty())
			{
				options.directory = arg;
			}
			else
			{
				err << "Only one shader directory may be given\n";
				return std::nullopt;
			}
		}

		if (options.directory.empty())
		{
			err << "No shader directory given\n";
			return std::nullopt;
		}

		return options;
	}

	void PrintInspectUsage(const std::string& program, std::ostream& err)
	{
		err << "Usage: " << program << " [--log-level trace|debug|info|warn|error|none]"
			<< " [--log-file <path>] [--no-color] <shader-directory>\n";
	}

	int RunInspect(const InspectOptions& options, std::ostream& out)
	{
		try
		{
			int unrecognized = 0;
			for (const auto& path : ListShaderBinaries(options.directory))
			{
				const std::string filename = path.filename().string();
				std::optional<ShaderStage> stage = TryInferShaderStage(filename);
				if (stage)
				{
					out << ShaderStageToString(*stage) << "\t" << path.string() << "\n";
				}
				else
				{
					out << "unrecognized\t" << path.string() << "\n";
					LOG_ERROR("Failed to define shader type for {}", filename);
					++unrecognized;
				}
			}

			return unrecognized == 0 ? kInspectExitOk : kInspectExitFailure;
		}
		catch (const std::filesystem::filesystem_error& e)
		{
			// Raised mid-iteration, not logged by the scanner
			LOG_ERROR("{}", e.what());
			return kInspectExitFailure;
		}
		catch (const std::runtime_error&)
		{
			// ListShaderBinaries logs before it throws
			return kInspectExitFailure;
		}
	}
}
