#include "FileUtils.hpp"
#include "ShaderStager/Core/Logger/Logger.hpp"

#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>

std::vector<uint8_t> ShaderStager::FileUtils::ReadFileAsBytes(const std::filesystem::path& filePath)
{
	std::error_code ec;
	if (std::filesystem::is_directory(filePath, ec))
	{
		LOG_ERROR("Expected a shader file but {} is a directory", filePath.string());
		throw std::runtime_error("Not a file: " + filePath.string());
	}

	std::ifstream file(filePath, std::ios::ate | std::ios::binary);

	if (!file.is_open())
	{
		LOG_ERROR("Failed to find compiled shader file at {}", filePath.string());
		throw std::runtime_error("Failed to open file: " + filePath.string());
	}

	std::streamoff endPos = file.tellg();
	if (endPos < 0)
	{
		LOG_ERROR("Cannot determine size of {}", filePath.string());
		throw std::runtime_error("Failed to query file size: " + filePath.string());
	}

	size_t fileSize = static_cast<size_t>(endPos);
	std::vector<uint8_t> buffer(fileSize);
	file.seekg(0);
	file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(fileSize));

	if (!file)
	{
		LOG_ERROR("Short read on {}", filePath.string());
		throw std::runtime_error("Failed to read file: " + filePath.string());
	}

	return buffer;
}

std::vector<uint32_t> ShaderStager::FileUtils::ReadSpirvFile(const std::filesystem::path& filePath)
{
	std::vector<uint8_t> bytes = ReadFileAsBytes(filePath);

	if (bytes.empty())
	{
		LOG_ERROR("Shader binary is empty: {}", filePath.string());
		throw std::runtime_error("Empty shader binary: " + filePath.string());
	}

	if (bytes.size() % sizeof(uint32_t) != 0)
	{
		LOG_ERROR("Shader binary {} is {} bytes, not a multiple of 4", filePath.string(), bytes.size());
		throw std::runtime_error("Shader binary size is not a multiple of 4: " + filePath.string());
	}

	std::vector<uint32_t> words(bytes.size() / sizeof(uint32_t));
	std::memcpy(words.data(), bytes.data(), bytes.size());

	LOG_TRACE("Read {} bytes of SPIR-V from {}", bytes.size(), filePath.string());
	return words;
}
