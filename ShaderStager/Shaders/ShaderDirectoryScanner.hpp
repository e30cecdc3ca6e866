//------------------------------------------------------------------------------
// ShaderDirectoryScanner.hpp
//
// Lists the shader binaries in a directory together with their inferred stage
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "ShaderStager/Shaders/ShaderStage.hpp"

#include <filesystem>
#include <vector>

namespace ShaderStager
{
	struct ShaderFileEntry
	{
		std::filesystem::path path;
		ShaderStage stage = ShaderStage::Vertex;
	};

	// Non-recursive. Regular files passing IsShaderBinaryName, sorted by path, stage not inferred.
	// Throws std::runtime_error if the directory is missing.
	std::vector<std::filesystem::path> ListShaderBinaries(const std::filesystem::path& directory);

	// Non-recursive. Only regular files passing IsShaderBinaryName are returned, sorted by path.
	// Throws std::runtime_error if the directory is missing or a listed file has an unrecognized name.
	std::vector<ShaderFileEntry> ScanShaderDirectory(const std::filesystem::path& directory);
}
