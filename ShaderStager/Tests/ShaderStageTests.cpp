//------------------------------------------------------------------------------
// ShaderStageTests.cpp
//
// Unit tests for filename based stage inference
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include <stdexcept>
#include "ShaderStager/Shaders/ShaderStage.hpp"

using namespace ShaderStager;

TEST(ShaderBinaryNameTest, AcceptsKnownExtensions)
{
	EXPECT_TRUE(IsShaderBinaryName("triangle.vert.spv"));
	EXPECT_TRUE(IsShaderBinaryName("triangle.frag.spv"));
	EXPECT_TRUE(IsShaderBinaryName("lighting.vs"));
	EXPECT_TRUE(IsShaderBinaryName("lighting.fs"));
	EXPECT_TRUE(IsShaderBinaryName("particles.comp.spv"));
}

TEST(ShaderBinaryNameTest, RejectsOtherFiles)
{
	EXPECT_FALSE(IsShaderBinaryName("triangle.vert"));
	EXPECT_FALSE(IsShaderBinaryName("README.md"));
	EXPECT_FALSE(IsShaderBinaryName("shaders.json"));
	EXPECT_FALSE(IsShaderBinaryName(""));
}

TEST(InferShaderStageTest, VertexNames)
{
	EXPECT_EQ(InferShaderStage("triangle.vert.spv"), ShaderStage::Vertex);
	EXPECT_EQ(InferShaderStage("shadowvert.spv"), ShaderStage::Vertex);
	EXPECT_EQ(InferShaderStage("basic.vs"), ShaderStage::Vertex);
	EXPECT_EQ(InferShaderStage("basic.vs.spv"), ShaderStage::Vertex);
}

TEST(InferShaderStageTest, FragmentNames)
{
	EXPECT_EQ(InferShaderStage("triangle.frag.spv"), ShaderStage::Fragment);
	EXPECT_EQ(InferShaderStage("basic.fs"), ShaderStage::Fragment);
	EXPECT_EQ(InferShaderStage("basic.fs.spv"), ShaderStage::Fragment);
}

TEST(InferShaderStageTest, VertexRulesWinOverFragment)
{
	EXPECT_EQ(InferShaderStage("combined.vs.frag.spv"), ShaderStage::Vertex);
}

TEST(InferShaderStageTest, UnrecognizedNameThrows)
{
	EXPECT_THROW(InferShaderStage("particles.comp.spv"), std::runtime_error);
	EXPECT_THROW(InferShaderStage("terrain.geom.spv"), std::runtime_error);
	EXPECT_THROW(InferShaderStage("TRIANGLE.VERT.SPV"), std::runtime_error);
	EXPECT_FALSE(TryInferShaderStage("particles.comp.spv").has_value());
}

TEST(InferShaderStageTest, ErrorNamesTheFile)
{
	try
	{
		InferShaderStage("mystery.spv");
		FAIL() << "expected std::runtime_error";
	}
	catch (const std::runtime_error& e)
	{
		EXPECT_NE(std::string(e.what()).find("mystery.spv"), std::string::npos);
	}
}

TEST(ShaderStageTest, MapsToVulkanBits)
{
	EXPECT_EQ(ToVkShaderStage(ShaderStage::Vertex), VK_SHADER_STAGE_VERTEX_BIT);
	EXPECT_EQ(ToVkShaderStage(ShaderStage::Fragment), VK_SHADER_STAGE_FRAGMENT_BIT);
	EXPECT_STREQ(ShaderStageToString(ShaderStage::Vertex), "vertex");
	EXPECT_STREQ(ShaderStageToString(ShaderStage::Fragment), "fragment");
}
