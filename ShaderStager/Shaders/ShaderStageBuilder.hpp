//------------------------------------------------------------------------------
// ShaderStageBuilder.hpp
//
// Builds one VkPipelineShaderStageCreateInfo per shader binary found in a
// directory. Stages are inferred from filenames (see ShaderStage.hpp).
//
// Usage:
//   VulkanShaderModuleFactory factory(device);
//   ShaderStageSet stages = ShaderStageBuilder(&factory, "compiled_shaders")
//       .WithStageFlags(VK_PIPELINE_SHADER_STAGE_CREATE_ALLOW_VARYING_SUBGROUP_SIZE_BIT)
//       .Build();
//   pipelineInfo.stageCount = static_cast<uint32_t>(stages.Size());
//   pipelineInfo.pStages = stages.GetStageInfos().data();
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "ShaderStager/Shaders/ShaderStageSet.hpp"

#include <filesystem>
#include <string>

namespace ShaderStager
{
	class IShaderModuleFactory;

	class ShaderStageBuilder
	{
	public:
		// factory is not owned and must outlive the ShaderStageSet returned by Build()
		ShaderStageBuilder(IShaderModuleFactory* factory, std::filesystem::path directory);

		// VkShaderModuleCreateInfo::flags
		ShaderStageBuilder& WithShaderModuleFlags(VkShaderModuleCreateFlags flags);
		// VkShaderModuleCreateInfo::pNext
		ShaderStageBuilder& WithShaderModuleNext(const void* pNext);

		// VkPipelineShaderStageCreateInfo::flags
		ShaderStageBuilder& WithStageFlags(VkPipelineShaderStageCreateFlags flags);
		// VkPipelineShaderStageCreateInfo::pNext
		ShaderStageBuilder& WithStageNext(const void* pNext);

		// Shared by every stage. Not copied, must outlive pipeline creation.
		ShaderStageBuilder& WithSpecializationInfo(const VkSpecializationInfo* specializationInfo);

		// Defaults to "main". Throws std::invalid_argument if empty or containing a NUL.
		ShaderStageBuilder& WithEntryPoint(const std::string& entryPoint);

		// Scans the directory, creates one module per binary and fills in the stage infos.
		// Throws std::runtime_error on any failure; modules created before the failure are destroyed.
		ShaderStageSet Build() const;

		const std::filesystem::path& GetDirectory() const { return m_Directory; }
		VkShaderModuleCreateFlags GetShaderModuleFlags() const { return m_ShaderModuleFlags; }
		const void* GetShaderModuleNext() const { return m_ShaderModuleNext; }
		VkPipelineShaderStageCreateFlags GetStageFlags() const { return m_StageFlags; }
		const void* GetStageNext() const { return m_StageNext; }
		const VkSpecializationInfo* GetSpecializationInfo() const { return m_SpecializationInfo; }
		const std::string& GetEntryPoint() const { return m_EntryPoint; }

	private:
		IShaderModuleFactory* m_Factory = nullptr;
		std::filesystem::path m_Directory;

		VkShaderModuleCreateFlags m_ShaderModuleFlags = 0;
		const void* m_ShaderModuleNext = nullptr;

		VkPipelineShaderStageCreateFlags m_StageFlags = 0;
		const void* m_StageNext = nullptr;
		const VkSpecializationInfo* m_SpecializationInfo = nullptr;

		std::string m_EntryPoint = "main";
	};
}
