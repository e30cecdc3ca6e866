//------------------------------------------------------------------------------
// ShaderDirectoryScanner.cpp
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include "ShaderStager/Shaders/ShaderDirectoryScanner.hpp"
#include "ShaderStager/Core/Logger/Logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace ShaderStager
{
	namespace fs = std::filesystem;

	std::vector<fs::path> ListShaderBinaries(const fs::path& directory)
	{
		std::error_code ec;
		if (!fs::is_directory(directory, ec))
		{
			LOG_ERROR("Failed to find spv file at {}", directory.string());
			throw std::runtime_error("Shader directory does not exist: " + directory.string());
		}

		std::vector<fs::path> paths;
		fs::directory_iterator it(directory, ec);
		if (ec)
		{
			LOG_ERROR("Cannot read shader directory {}: {}", directory.string(), ec.message());
			throw std::runtime_error("Cannot read shader directory: " + directory.string());
		}

		for (const auto& entry : it)
		{
			const std::string filename = entry.path().filename().string();

			if (!entry.is_regular_file(ec))
			{
				LOG_TRACE("Skipping non-file entry {}", filename);
				continue;
			}

			if (!IsShaderBinaryName(filename))
			{
				LOG_TRACE("Skipping {}, not a shader binary", filename);
				continue;
			}

			paths.push_back(entry.path());
		}

		// directory_iterator order is unspecified
		std::sort(paths.begin(), paths.end());
		return paths;
	}

	std::vector<ShaderFileEntry> ScanShaderDirectory(const fs::path& directory)
	{
		std::vector<fs::path> paths = ListShaderBinaries(directory);

		std::vector<ShaderFileEntry> entries;
		entries.reserve(paths.size());
		for (auto& path : paths)
		{
			ShaderStage stage = InferShaderStage(path.filename().string());
			LOG_DEBUG("  - {} ({})", path.filename().string(), ShaderStageToString(stage));
			entries.push_back({ std::move(path), stage });
		}

		if (entries.empty())
		{
			LOG_WARN("No shader binaries found in {}", directory.string());
		}
		else
		{
			LOG_INFO("Found {} shader binaries in {}", entries.size(), directory.string());
		}

		return entries;
	}
}
