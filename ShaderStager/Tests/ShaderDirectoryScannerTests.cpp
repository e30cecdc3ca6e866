//------------------------------------------------------------------------------
// ShaderDirectoryScannerTests.cpp
//
// Unit tests for directory scanning
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include <stdexcept>
#include "ShaderStager/Shaders/ShaderDirectoryScanner.hpp"
#include "TestHelpers.hpp"

using namespace ShaderStager;
using ShaderStager::Testing::TempDirectory;

TEST(ShaderDirectoryScannerTest, ListsShadersSortedWithStages)
{
	TempDirectory dir;
	dir.WriteSpirv("triangle.vert.spv");
	dir.WriteSpirv("triangle.frag.spv");
	dir.WriteSpirv("blit.vs");
	dir.WriteSpirv("blit.fs");

	std::vector<ShaderFileEntry> entries = ScanShaderDirectory(dir.Path());
	ASSERT_EQ(entries.size(), 4u);

	EXPECT_EQ(entries[0].path.filename().string(), "blit.fs");
	EXPECT_EQ(entries[0].stage, ShaderStage::Fragment);
	EXPECT_EQ(entries[1].path.filename().string(), "blit.vs");
	EXPECT_EQ(entries[1].stage, ShaderStage::Vertex);
	EXPECT_EQ(entries[2].path.filename().string(), "triangle.frag.spv");
	EXPECT_EQ(entries[2].stage, ShaderStage::Fragment);
	EXPECT_EQ(entries[3].path.filename().string(), "triangle.vert.spv");
	EXPECT_EQ(entries[3].stage, ShaderStage::Vertex);
}

TEST(ShaderDirectoryScannerTest, SkipsUnrelatedFilesAndSubdirectories)
{
	TempDirectory dir;
	dir.WriteSpirv("mesh.vert.spv");
	dir.WriteBytes("mesh.vert", { 'v', 'o', 'i', 'd' });
	dir.WriteBytes("notes.txt", { 'h', 'i' });
	dir.MakeSubdirectory("nested.vert.spv");
	dir.WriteSpirv("nested.vert.spv/inner.frag.spv");

	std::vector<ShaderFileEntry> entries = ScanShaderDirectory(dir.Path());
	ASSERT_EQ(entries.size(), 1u);
	EXPECT_EQ(entries[0].path.filename().string(), "mesh.vert.spv");
}

TEST(ShaderDirectoryScannerTest, DirectoryNameDoesNotAffectMatching)
{
	TempDirectory dir;
	auto shaders = dir.MakeSubdirectory("build.vs");
	std::ofstream(shaders / "readme.txt") << "not a shader";

	EXPECT_TRUE(ScanShaderDirectory(shaders).empty());
}

TEST(ShaderDirectoryScannerTest, EmptyDirectoryYieldsNothing)
{
	TempDirectory dir;
	EXPECT_TRUE(ScanShaderDirectory(dir.Path()).empty());
}

TEST(ShaderDirectoryScannerTest, MissingDirectoryThrows)
{
	TempDirectory dir;
	EXPECT_THROW(ScanShaderDirectory(dir.Path() / "does_not_exist"), std::runtime_error);
}

TEST(ShaderDirectoryScannerTest, FileInsteadOfDirectoryThrows)
{
	TempDirectory dir;
	auto file = dir.WriteSpirv("lonely.vert.spv");
	EXPECT_THROW(ScanShaderDirectory(file), std::runtime_error);
}

TEST(ShaderDirectoryScannerTest, UnrecognizedShaderNameThrows)
{
	TempDirectory dir;
	dir.WriteSpirv("triangle.vert.spv");
	dir.WriteSpirv("particles.comp.spv");

	EXPECT_THROW(ScanShaderDirectory(dir.Path()), std::runtime_error);

	// Listing alone does not classify
	EXPECT_EQ(ListShaderBinaries(dir.Path()).size(), 2u);
}
