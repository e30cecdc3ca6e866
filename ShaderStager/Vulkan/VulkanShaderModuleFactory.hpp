//------------------------------------------------------------------------------
// VulkanShaderModuleFactory.hpp
//
// IShaderModuleFactory backed by a logical device
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "ShaderStager/Vulkan/ShaderModuleFactory.hpp"

namespace ShaderStager
{
	class VulkanShaderModuleFactory : public IShaderModuleFactory
	{
	public:
		// The device (and allocator, if any) must outlive every module created here
		explicit VulkanShaderModuleFactory(VkDevice device, const VkAllocationCallbacks* allocator = nullptr);
		~VulkanShaderModuleFactory() override = default;

		VkResult CreateShaderModule(const VkShaderModuleCreateInfo& createInfo, VkShaderModule* outModule) override;
		void DestroyShaderModule(VkShaderModule module) override;

		VkDevice GetDevice() const { return m_Device; }

	private:
		VkDevice m_Device = VK_NULL_HANDLE;
		const VkAllocationCallbacks* m_Allocator = nullptr;
	};
}
