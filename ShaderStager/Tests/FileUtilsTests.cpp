//------------------------------------------------------------------------------
// FileUtilsTests.cpp
//
// Unit tests for shader binary loading
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include <stdexcept>
#include "ShaderStager/Core/FileUtils.hpp"
#include "TestHelpers.hpp"

using namespace ShaderStager;
using ShaderStager::Testing::TempDirectory;

TEST(FileUtilsTest, ReadsBytesVerbatim)
{
	TempDirectory dir;
	auto path = dir.WriteBytes("blob.spv", { 0x01, 0x02, 0x03 });

	std::vector<uint8_t> bytes = FileUtils::ReadFileAsBytes(path);
	ASSERT_EQ(bytes.size(), 3u);
	EXPECT_EQ(bytes[0], 0x01);
	EXPECT_EQ(bytes[2], 0x03);
}

TEST(FileUtilsTest, MissingFileThrows)
{
	TempDirectory dir;
	EXPECT_THROW(FileUtils::ReadFileAsBytes(dir.Path() / "missing.vert.spv"), std::runtime_error);
	EXPECT_THROW(FileUtils::ReadSpirvFile(dir.Path() / "missing.vert.spv"), std::runtime_error);
}

TEST(FileUtilsTest, DirectoryInsteadOfFileThrows)
{
	TempDirectory dir;
	auto nested = dir.MakeSubdirectory("looks_like.vert.spv");

	EXPECT_THROW(FileUtils::ReadFileAsBytes(nested), std::runtime_error);
	EXPECT_THROW(FileUtils::ReadSpirvFile(nested), std::runtime_error);
}

TEST(FileUtilsTest, ReadSpirvKeepsWords)
{
	TempDirectory dir;
	auto path = dir.WriteSpirv("tri.vert.spv", 6);

	std::vector<uint32_t> words = FileUtils::ReadSpirvFile(path);
	ASSERT_EQ(words.size(), 6u);
	EXPECT_EQ(words[0], Testing::kSpirvMagic);
	EXPECT_EQ(words[5], 5u);
}

TEST(FileUtilsTest, ReadSpirvRejectsEmptyFile)
{
	TempDirectory dir;
	auto path = dir.WriteBytes("empty.frag.spv", {});

	EXPECT_THROW(FileUtils::ReadSpirvFile(path), std::runtime_error);
}

TEST(FileUtilsTest, ReadSpirvRejectsPartialWord)
{
	TempDirectory dir;
	auto path = dir.WriteBytes("odd.frag.spv", { 0x03, 0x02, 0x23, 0x07, 0xAA, 0xBB });

	EXPECT_THROW(FileUtils::ReadSpirvFile(path), std::runtime_error);
}
