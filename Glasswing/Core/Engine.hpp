//------------------------------------------------------------------------------
// Engine.hpp
//
// Library initialization and shutdown
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------
#pragma once

#include "Glasswing/Core/Logger/Logger.hpp"
#include <string>

namespace Glasswing
{
	struct EngineConfig
	{
		LogLevel logLevel = LogLevel::Info;
		bool consoleLogging = true;
		bool consoleColors = true;
		std::string logFilePath;  // empty = no file sink
		bool breakOnAssert = true; // only honoured when a debugger is attached
	};

	// Installs the log sinks and assert policy described by config
	void GlasswingInit(const EngineConfig& config = EngineConfig{});

	// Flushes and removes every log sink
	void GlasswingShutdown();
}
