//------------------------------------------------------------------------------
// ShaderStageBuilder.cpp
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include "ShaderStager/Shaders/ShaderStageBuilder.hpp"
#include "ShaderStager/Shaders/ShaderDirectoryScanner.hpp"
#include "ShaderStager/Vulkan/ShaderModuleFactory.hpp"
#include "ShaderStager/Core/FileUtils.hpp"
#include "ShaderStager/Core/Logger/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace ShaderStager
{
	ShaderStageBuilder::ShaderStageBuilder(IShaderModuleFactory* factory, std::filesystem::path directory)
		: m_Factory(factory)
		, m_Directory(std::move(directory))
	{
		if (m_Factory == nullptr)
		{
			LOG_ERROR("ShaderStageBuilder created without a shader module factory");
			throw std::invalid_argument("ShaderStageBuilder: factory is null");
		}
	}

	ShaderStageBuilder& ShaderStageBuilder::WithShaderModuleFlags(VkShaderModuleCreateFlags flags)
	{
		m_ShaderModuleFlags = flags;
		return *this;
	}

	ShaderStageBuilder& ShaderStageBuilder::WithShaderModuleNext(const void* pNext)
	{
		m_ShaderModuleNext = pNext;
		return *this;
	}

	ShaderStageBuilder& ShaderStageBuilder::WithStageFlags(VkPipelineShaderStageCreateFlags flags)
	{
		m_StageFlags = flags;
		return *this;
	}

	ShaderStageBuilder& ShaderStageBuilder::WithStageNext(const void* pNext)
	{
		m_StageNext = pNext;
		return *this;
	}

	ShaderStageBuilder& ShaderStageBuilder::WithSpecializationInfo(const VkSpecializationInfo* specializationInfo)
	{
		m_SpecializationInfo = specializationInfo;
		return *this;
	}

	ShaderStageBuilder& ShaderStageBuilder::WithEntryPoint(const std::string& entryPoint)
	{
		if (entryPoint.empty())
		{
			LOG_ERROR("Shader entry point name is empty");
			throw std::invalid_argument("Shader entry point name must not be empty");
		}

		if (entryPoint.find('\0') != std::string::npos)
		{
			LOG_ERROR("Shader entry point name contains a NUL character");
			throw std::invalid_argument("Shader entry point name must not contain NUL");
		}

		m_EntryPoint = entryPoint;
		return *this;
	}

	ShaderStageSet ShaderStageBuilder::Build() const
	{
		LOG_INFO("Building shader stages from {}", m_Directory.string());

		std::vector<ShaderFileEntry> entries = ScanShaderDirectory(m_Directory);

		// Owns every module as soon as it is created, so a throw below cleans up
		ShaderStageSet stages(m_Factory, m_EntryPoint);

		for (ShaderFileEntry& entry : entries)
		{
			std::vector<uint32_t> code = FileUtils::ReadSpirvFile(entry.path);

			VkShaderModuleCreateInfo moduleInfo{};
			moduleInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
			moduleInfo.pNext = m_ShaderModuleNext;
			moduleInfo.flags = m_ShaderModuleFlags;
			moduleInfo.codeSize = code.size() * sizeof(uint32_t);
			moduleInfo.pCode = code.data();

			VkShaderModule shaderModule = VK_NULL_HANDLE;
			VkResult result = m_Factory->CreateShaderModule(moduleInfo, &shaderModule);
			if (result != VK_SUCCESS)
			{
				std::string resultName = VulkanUtils::VkResultToString(result);
				LOG_ERROR("Failed to create shader module from {}: {}", entry.path.string(), resultName);
				throw std::runtime_error("Failed to create shader module from " + entry.path.string() + ": " + resultName);
			}

			VkPipelineShaderStageCreateInfo stageInfo{};
			stageInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
			stageInfo.pNext = m_StageNext;
			stageInfo.flags = m_StageFlags;
			stageInfo.stage = ToVkShaderStage(entry.stage);
			stageInfo.pSpecializationInfo = m_SpecializationInfo;

			LOG_TRACE("Created {} shader module from {}", ShaderStageToString(entry.stage), entry.path.filename().string());

			// module and pName are set by the set itself
			stages.Add(shaderModule, std::move(entry.path), entry.stage, stageInfo);
		}

		LOG_INFO("Built {} shader stages", stages.Size());
		return stages;
	}
}
