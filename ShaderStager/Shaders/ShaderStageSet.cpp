//------------------------------------------------------------------------------
// ShaderStageSet.cpp
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include "ShaderStager/Shaders/ShaderStageSet.hpp"
#include "ShaderStager/Vulkan/ShaderModuleFactory.hpp"
#include "ShaderStager/Core/Logger/Logger.hpp"

#include <utility>

namespace ShaderStager
{
	ShaderStageSet::ShaderStageSet(IShaderModuleFactory* factory, std::string entryPoint)
		: m_Factory(factory)
		, m_EntryPoint(std::make_unique<std::string>(std::move(entryPoint)))
	{
	}

	ShaderStageSet::~ShaderStageSet()
	{
		DestroyModules();
	}

	ShaderStageSet::ShaderStageSet(ShaderStageSet&& other) noexcept
		: m_Factory(std::exchange(other.m_Factory, nullptr))
		, m_EntryPoint(std::move(other.m_EntryPoint))
		, m_Modules(std::move(other.m_Modules))
		, m_SourcePaths(std::move(other.m_SourcePaths))
		, m_Stages(std::move(other.m_Stages))
		, m_StageInfos(std::move(other.m_StageInfos))
		, m_OwnsModules(other.m_OwnsModules)
	{
		other.ClearMovedFrom();
	}

	ShaderStageSet& ShaderStageSet::operator=(ShaderStageSet&& other) noexcept
	{
		if (this != &other)
		{
			DestroyModules();

			m_Factory = std::exchange(other.m_Factory, nullptr);
			m_EntryPoint = std::move(other.m_EntryPoint);
			m_Modules = std::move(other.m_Modules);
			m_SourcePaths = std::move(other.m_SourcePaths);
			m_Stages = std::move(other.m_Stages);
			m_StageInfos = std::move(other.m_StageInfos);
			m_OwnsModules = other.m_OwnsModules;

			other.ClearMovedFrom();
		}
		return *this;
	}

	void ShaderStageSet::Add(VkShaderModule module, std::filesystem::path sourcePath, ShaderStage stage, VkPipelineShaderStageCreateInfo stageInfo)
	{
		// A moved-from set starts over with the default entry point
		if (!m_EntryPoint)
			m_EntryPoint = std::make_unique<std::string>("main");

		stageInfo.module = module;
		stageInfo.pName = m_EntryPoint->c_str();

		m_Modules.push_back(module);
		m_SourcePaths.push_back(std::move(sourcePath));
		m_Stages.push_back(stage);
		m_StageInfos.push_back(stageInfo);
	}

	const std::string& ShaderStageSet::GetEntryPoint() const
	{
		static const std::string s_Empty;
		return m_EntryPoint ? *m_EntryPoint : s_Empty;
	}

	std::vector<VkShaderModule> ShaderStageSet::ReleaseModules()
	{
		m_OwnsModules = false;
		return m_Modules;
	}

	void ShaderStageSet::ClearMovedFrom() noexcept
	{
		m_Modules.clear();
		m_SourcePaths.clear();
		m_Stages.clear();
		m_StageInfos.clear();
		m_OwnsModules = true;
	}

	void ShaderStageSet::DestroyModules()
	{
		if (!m_OwnsModules || m_Factory == nullptr)
			return;

		for (VkShaderModule module : m_Modules)
		{
			m_Factory->DestroyShaderModule(module);
		}

		if (!m_Modules.empty())
		{
			LOG_DEBUG("Destroyed {} shader modules", m_Modules.size());
		}
		m_Modules.clear();
	}
}
