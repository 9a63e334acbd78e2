//------------------------------------------------------------------------------
// Assert.cpp
//
// Assertion and precondition handling for Glasswing
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------

#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Core/Logger/Logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

// Platform-specific includes
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#elif defined(__APPLE__)
#include <unistd.h>
#include <sys/types.h>
#include <sys/sysctl.h>
#endif

namespace Glasswing {
	namespace Debug {

		namespace {
			// Configuration flags
			bool g_breakOnAssert = true;
			AssertHandler g_assertHandler;

			// Assert statistics (useful for debugging)
			int g_totalAsserts = 0;

			// Check if debugger is attached
			bool IsDebuggerAttached() {
#ifdef _WIN32
				return IsDebuggerPresent() != 0;
#elif defined(__linux__)
				// Check if we're being traced (crude debugger detection)
				char buf[4096];
				FILE* file = fopen("/proc/self/status", "r");
				if (!file) return false;

				while (fgets(buf, sizeof(buf), file)) {
					if (strncmp(buf, "TracerPid:", 10) == 0) {
						int pid = atoi(buf + 10);
						fclose(file);
						return pid != 0;
					}
				}
				fclose(file);
				return false;
#elif defined(__APPLE__)
				int mib[4] = { CTL_KERN, KERN_PROC, KERN_PROC_PID, getpid() };
				struct kinfo_proc info = {};
				size_t size = sizeof(info);

				if (sysctl(mib, 4, &info, &size, nullptr, 0) == 0) {
					return (info.kp_proc.p_flag & P_TRACED) != 0;
				}
				return false;
#else
				return false;
#endif
			}

			void LogAssert(const char* condition, const char* message, const char* file, int line, const char* function) {
				LOG_ERROR("[ASSERT] {}:{} in {} - Condition '{}' failed: {}",
					file, line, function, condition, message);
			}
		}

		void SetAssertHandler(AssertHandler handler) {
			g_assertHandler = std::move(handler);
		}

		void SetBreakOnAssert(bool breakOnAssert) {
			g_breakOnAssert = breakOnAssert;
		}

		int GetTotalAssertCount() {
			return g_totalAsserts;
		}

		// Main assert handler
		void HandleAssertFailure(
			const char* condition,
			const char* message,
			const char* file,
			int line,
			const char* function)
		{
			g_totalAsserts++;

			LogAssert(condition, message, file, line, function);

			if (g_assertHandler) {
				g_assertHandler(condition, message, file, line, function);
				return;
			}

			if (g_breakOnAssert && IsDebuggerAttached()) {
				GLASSWING_DEBUG_BREAK();
				return;
			}

			// Internal invariants are not recoverable
			std::abort();
		}

		void HandlePreconditionFailure(
			const char* condition,
			const std::string& message,
			const char* file,
			int line,
			const char* function)
		{
			LOG_ERROR("Precondition '{}' violated in {} ({}:{}): {}",
				condition, function, file, line, message);
			throw PreconditionError(message);
		}
	}
}
