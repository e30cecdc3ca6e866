//------------------------------------------------------------------------------
// Base.hpp
//
// Common includes and definitions for ShaderStager
// Copyright (c) 2024 ShaderStager contributors. All rights reserved.
//------------------------------------------------------------------------------
#pragma once

// Platform detection - verify CMake defined the platform
#if !defined(SHADERSTAGER_PLATFORM_WINDOWS) && !defined(SHADERSTAGER_PLATFORM_LINUX) && !defined(SHADERSTAGER_PLATFORM_MACOS)
#error "No platform defined! Check CMakeLists.txt"
#endif

#include <cstdint>
#include <cstddef>

// Library version
#define SHADERSTAGER_VERSION_MAJOR 0
#define SHADERSTAGER_VERSION_MINOR 1
#define SHADERSTAGER_VERSION_PATCH 0

// Utility macros
#define SHADERSTAGER_DISABLE_COPY(ClassName) \
        ClassName(const ClassName&) = delete; \
        ClassName& operator=(const ClassName&) = delete;

