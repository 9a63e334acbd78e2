//------------------------------------------------------------------------------
// Assert.hpp
//
// Assertion and precondition handling for Glasswing
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#define UNUSED(x) (void)(x)

#include <format>
#include <string>
#include <string_view>
#include <functional>


namespace Glasswing
{
	namespace Debug
	{
		// Custom handler invoked instead of the default log-and-abort behaviour
		using AssertHandler = std::function<void(const char* condition, const char* message,
			const char* file, int line, const char* function)>;

		//Internal assert Handler - called when assertions fail
		void HandleAssertFailure(
			const char* condition,
			const char* message,
			const char* file,
			int line,
			const char* function
		);

		// Logs the failed precondition and throws PreconditionError
		[[noreturn]] void HandlePreconditionFailure(
			const char* condition,
			const std::string& message,
			const char* file,
			int line,
			const char* function
		);

		// Configuration
		void SetAssertHandler(AssertHandler handler);
		void SetBreakOnAssert(bool breakOnAssert);
		int GetTotalAssertCount();

		//Template helper for formatting assert messages
		template<typename... Args>
		std::string FormatAssertMessage(std::string_view format, Args&&... args)
		{
			if constexpr (sizeof...(args) == 0) 
			{
				return std::string(format);
			}
			else 
			{
				return std::vformat(format, std::make_format_args(args...));
			}
		}
	}
}

//Platform-specific debugger break
#ifdef _WIN32
#define GLASSWING_DEBUG_BREAK() __debugbreak()
#elif defined(__GNUC__) || defined(__clang__)
#include <signal.h>
#define GLASSWING_DEBUG_BREAK() raise(SIGTRAP)
#else
#define GLASSWING_DEBUG_BREAK() ((void)0)
#endif

// Internal macro to handle assert logic
#define GLASSWING_ASSERT_IMPL(condition, message, ...) \
    do { \
        if (!(condition)) { \
            std::string formatted_msg = ::Glasswing::Debug::FormatAssertMessage(message, ##__VA_ARGS__); \
            ::Glasswing::Debug::HandleAssertFailure( \
                #condition, \
                formatted_msg.c_str(), \
                __FILE__, \
                __LINE__, \
                __FUNCTION__ \
            ); \
        } \
    } while (0)

// Debug build configuration check
#if defined(DEBUG) || defined(_DEBUG) || !defined(NDEBUG)
#define GLASSWING_DEBUG_BUILD 1
#else
#define GLASSWING_DEBUG_BUILD 0
#endif

// ============================================================================
// PUBLIC API MACROS
// ============================================================================

// ASSERT - Debug-only assertion that completely disappears in release builds
#if GLASSWING_DEBUG_BUILD
#define ASSERT(condition, message, ...) \
        GLASSWING_ASSERT_IMPL(condition, message, ##__VA_ARGS__)
#else
#define ASSERT(condition, message, ...) ((void)0)
#endif

// VERIFY - Always evaluated and always fatal, used for internal invariants
#define VERIFY(condition, message, ...) \
        GLASSWING_ASSERT_IMPL(condition, message, ##__VA_ARGS__)

// ASSERT_NOT_REACHED - Marks code paths that should never execute
#define ASSERT_NOT_REACHED(message, ...) \
        do { \
            std::string formatted_msg = ::Glasswing::Debug::FormatAssertMessage(message, ##__VA_ARGS__); \
            ::Glasswing::Debug::HandleAssertFailure( \
                "false", \
                formatted_msg.c_str(), \
                __FILE__, \
                __LINE__, \
                __FUNCTION__ \
            ); \
        } while (0)

// CHECK_PRECONDITION - Caller contract, checked in every build.
// A violation aborts the operation by throwing PreconditionError.
#define GLASSWING_CHECK_PRECONDITION(condition, message, ...) \
    do { \
        if (!(condition)) { \
            ::Glasswing::Debug::HandlePreconditionFailure( \
                #condition, \
                ::Glasswing::Debug::FormatAssertMessage(message, ##__VA_ARGS__), \
                __FILE__, \
                __LINE__, \
                __FUNCTION__ \
            ); \
        } \
    } while (0)
