//------------------------------------------------------------------------------
// ShaderStage.cpp
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include "ShaderStager/Shaders/ShaderStage.hpp"
#include "ShaderStager/Core/Logger/Logger.hpp"

#include <stdexcept>
#include <string>

namespace ShaderStager
{
	namespace
	{
		bool Contains(std::string_view haystack, std::string_view needle)
		{
			return haystack.find(needle) != std::string_view::npos;
		}
	}

	bool IsShaderBinaryName(std::string_view filename)
	{
		return Contains(filename, ".spv") || Contains(filename, ".vs") || Contains(filename, ".fs");
	}

	std::optional<ShaderStage> TryInferShaderStage(std::string_view filename)
	{
		if (Contains(filename, "vert.spv") || Contains(filename, ".vs"))
			return ShaderStage::Vertex;

		if (Contains(filename, "frag.spv") || Contains(filename, ".fs"))
			return ShaderStage::Fragment;

		return std::nullopt;
	}

	ShaderStage InferShaderStage(std::string_view filename)
	{
		std::optional<ShaderStage> stage = TryInferShaderStage(filename);
		if (!stage)
		{
			LOG_ERROR("Failed to define shader type for {}", filename);
			throw std::runtime_error("Failed to define shader type: " + std::string(filename));
		}
		return *stage;
	}

	VkShaderStageFlagBits ToVkShaderStage(ShaderStage stage)
	{
		switch (stage)
		{
		case ShaderStage::Vertex:
			return VK_SHADER_STAGE_VERTEX_BIT;
		case ShaderStage::Fragment:
			return VK_SHADER_STAGE_FRAGMENT_BIT;
		}

		throw std::invalid_argument("Unknown shader stage: " + std::to_string(static_cast<int>(stage)));
	}

	const char* ShaderStageToString(ShaderStage stage)
	{
		switch (stage)
		{
		case ShaderStage::Vertex: return "vertex";
		case ShaderStage::Fragment: return "fragment";
		default: return "unknown";
		}
	}
}
