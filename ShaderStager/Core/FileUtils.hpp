// File utils folder

#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace ShaderStager
{
	// FileUtils.hpp

	class FileUtils
	{
	public:
		// Reads the entire file into a vector of bytes
		static std::vector<uint8_t> ReadFileAsBytes(const std::filesystem::path& filePath);

		// Reads a SPIR-V binary into word-aligned storage.
		// Throws if the file is missing, empty, or not a whole number of 32-bit words.
		static std::vector<uint32_t> ReadSpirvFile(const std::filesystem::path& filePath);
	};
}
