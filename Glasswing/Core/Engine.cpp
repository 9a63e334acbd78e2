//------------------------------------------------------------------------------
// Engine.cpp
//
// Library initialization and shutdown
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------

#include "Glasswing/Core/Engine.hpp"
#include "Glasswing/Core/Base.hpp"
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Logger/ConsoleLogger.hpp"
#include "Glasswing/Core/Logger/FileLogger.hpp"

namespace Glasswing
{
	void GlasswingInit(const EngineConfig& config)
	{
		Logger& logger = Logger::Get();

		if (config.consoleLogging)
		{
			logger.AddSink(std::make_shared<ConsoleLogger>(config.consoleColors));
		}

		if (!config.logFilePath.empty())
		{
			logger.AddSink(std::make_shared<FileLogger>(config.logFilePath));
		}

		logger.SetLogLevel(config.logLevel);
		Debug::SetBreakOnAssert(config.breakOnAssert);

		LOG_INFO("Glasswing {}.{}.{} initialized",
			GLASSWING_VERSION_MAJOR,
			GLASSWING_VERSION_MINOR,
			GLASSWING_VERSION_PATCH);

		const char* platformName = "Unknown Platform";

#ifdef GLASSWING_PLATFORM_WINDOWS
		platformName = "Windows";
#elif defined(GLASSWING_PLATFORM_LINUX)
		platformName = "Linux";
#elif defined(GLASSWING_PLATFORM_MACOS)
		platformName = "MacOS";
#endif

		LOG_INFO("Running on platform: {}", platformName);
	}

	void GlasswingShutdown()
	{
		LOG_INFO("Shutting down Glasswing...");
		Logger::Get().ClearSinks();
	}
}
