//------------------------------------------------------------------------------
// VulkanShaderModuleFactory.cpp
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include "ShaderStager/Vulkan/VulkanShaderModuleFactory.hpp"
#include "ShaderStager/Core/Logger/Logger.hpp"

#include <stdexcept>

namespace ShaderStager
{
	VulkanShaderModuleFactory::VulkanShaderModuleFactory(VkDevice device, const VkAllocationCallbacks* allocator)
		: m_Device(device)
		, m_Allocator(allocator)
	{
		if (m_Device == VK_NULL_HANDLE)
		{
			LOG_ERROR("VulkanShaderModuleFactory needs a valid VkDevice");
			throw std::invalid_argument("VulkanShaderModuleFactory: device is VK_NULL_HANDLE");
		}
	}

	VkResult VulkanShaderModuleFactory::CreateShaderModule(const VkShaderModuleCreateInfo& createInfo, VkShaderModule* outModule)
	{
		VkShaderModule shaderModule = VK_NULL_HANDLE;
		VkResult result = vkCreateShaderModule(m_Device, &createInfo, m_Allocator, &shaderModule);
		if (result != VK_SUCCESS)
		{
			return result;
		}

		*outModule = shaderModule;
		return VK_SUCCESS;
	}

	void VulkanShaderModuleFactory::DestroyShaderModule(VkShaderModule module)
	{
		if (module != VK_NULL_HANDLE)
		{
			vkDestroyShaderModule(m_Device, module, m_Allocator);
			LOG_TRACE("Destroyed shader module");
		}
	}
}
