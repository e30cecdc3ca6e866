//------------------------------------------------------------------------------
// ShaderStage.hpp
//
// Pipeline stage of a precompiled shader binary, inferred from its filename
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "ShaderStager/Vulkan/VulkanCommon.hpp"

#include <optional>
#include <string_view>

namespace ShaderStager
{
	enum class ShaderStage
	{
		Vertex,
		Fragment
	};

	// True for names that look like a shader binary: contains ".spv", ".vs" or ".fs"
	bool IsShaderBinaryName(std::string_view filename);

	// "vert.spv" / ".vs" -> Vertex, "frag.spv" / ".fs" -> Fragment, checked in that order.
	std::optional<ShaderStage> TryInferShaderStage(std::string_view filename);

	// Same as TryInferShaderStage but throws std::runtime_error for an unrecognized name
	ShaderStage InferShaderStage(std::string_view filename);

	VkShaderStageFlagBits ToVkShaderStage(ShaderStage stage);

	const char* ShaderStageToString(ShaderStage stage);
}
