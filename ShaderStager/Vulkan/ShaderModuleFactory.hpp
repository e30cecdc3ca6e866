//------------------------------------------------------------------------------
// ShaderModuleFactory.hpp
//
// Abstract seam over shader module creation so the stage builder does not
// talk to a VkDevice directly
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "ShaderStager/Vulkan/VulkanCommon.hpp"

namespace ShaderStager
{
	class IShaderModuleFactory
	{
	public:
		virtual ~IShaderModuleFactory() = default;

		// Returns the driver result; outModule is only written on VK_SUCCESS
		virtual VkResult CreateShaderModule(const VkShaderModuleCreateInfo& createInfo, VkShaderModule* outModule) = 0;

		virtual void DestroyShaderModule(VkShaderModule module) = 0;
	};
}
