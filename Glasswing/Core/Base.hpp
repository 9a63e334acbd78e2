//------------------------------------------------------------------------------
// Base.hpp
//
// Common includes and definitions for Glasswing
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------
#pragma once

// Platform detection - verify CMake defined the platform
#if !defined(GLASSWING_PLATFORM_WINDOWS) && !defined(GLASSWING_PLATFORM_LINUX) && !defined(GLASSWING_PLATFORM_MACOS)
#error "No platform defined! Check CMakeLists.txt"
#endif

// Standard includes
#include <cstdint>
#include <cstddef>
#include <vector>

// Library version
#define GLASSWING_VERSION_MAJOR 0
#define GLASSWING_VERSION_MINOR 1
#define GLASSWING_VERSION_PATCH 0

namespace Glasswing
{
	// Type aliases
	using uint8 = std::uint8_t;
	using uint16 = std::uint16_t;
	using uint32 = std::uint32_t;
	using int32 = std::int32_t;

	// Raw bytes handed to or kept for a backend
	using ByteBuffer = std::vector<uint8>;

	// Utility macros
#define GLASSWING_DISABLE_COPY(ClassName) \
        ClassName(const ClassName&) = delete; \
        ClassName& operator=(const ClassName&) = delete;

#define GLASSWING_DISABLE_COPY_AND_MOVE(ClassName) \
        GLASSWING_DISABLE_COPY(ClassName) \
        ClassName(ClassName&&) = delete; \
        ClassName& operator=(ClassName&&) = delete;
}
