//------------------------------------------------------------------------------
// ShaderStageSet.hpp
//
// The result of ShaderStageBuilder::Build(): the shader modules created from a
// directory and the VkPipelineShaderStageCreateInfo that reference them
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "ShaderStager/Core/Base.hpp"
#include "ShaderStager/Shaders/ShaderStage.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ShaderStager
{
	class IShaderModuleFactory;

	class ShaderStageSet
	{
	public:
		ShaderStageSet() = default;

		// factory must outlive the set; modules still owned at destruction are destroyed through it
		ShaderStageSet(IShaderModuleFactory* factory, std::string entryPoint);
		~ShaderStageSet();

		SHADERSTAGER_DISABLE_COPY(ShaderStageSet)

		ShaderStageSet(ShaderStageSet&& other) noexcept;
		ShaderStageSet& operator=(ShaderStageSet&& other) noexcept;

		// Takes ownership of module. stageInfo.module and stageInfo.pName are filled in here.
		void Add(VkShaderModule module, std::filesystem::path sourcePath, ShaderStage stage, VkPipelineShaderStageCreateInfo stageInfo);

		// Ready to hand to VkGraphicsPipelineCreateInfo::pStages
		const std::vector<VkPipelineShaderStageCreateInfo>& GetStageInfos() const { return m_StageInfos; }
		const std::vector<VkShaderModule>& GetModules() const { return m_Modules; }
		const std::vector<std::filesystem::path>& GetSourcePaths() const { return m_SourcePaths; }
		const std::vector<ShaderStage>& GetStages() const { return m_Stages; }
		// Empty for a moved-from set
		const std::string& GetEntryPoint() const;

		size_t Size() const { return m_Modules.size(); }
		bool Empty() const { return m_Modules.empty(); }

		// Caller becomes responsible for destroying the returned modules.
		// Stage infos stay readable but the set no longer destroys anything.
		std::vector<VkShaderModule> ReleaseModules();

	private:
		void ClearMovedFrom() noexcept;
		void DestroyModules();

		IShaderModuleFactory* m_Factory = nullptr;

		// Heap-allocated so pName stays valid when the set is moved; null once moved from
		std::unique_ptr<std::string> m_EntryPoint = std::make_unique<std::string>("main");

		std::vector<VkShaderModule> m_Modules;
		std::vector<std::filesystem::path> m_SourcePaths;
		std::vector<ShaderStage> m_Stages;
		std::vector<VkPipelineShaderStageCreateInfo> m_StageInfos;
		bool m_OwnsModules = true;
	};
}
