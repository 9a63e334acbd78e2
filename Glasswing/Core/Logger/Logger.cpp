//------------------------------------------------------------------------------
// Logger.cpp
//
// Core logging system implementation
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------

#include "Glasswing/Core/Logger/Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Glasswing
{
	const char* LogLevelToString(LogLevel level)
	{
		switch (level)
		{
		case LogLevel::Trace: return "TRACE";
		case LogLevel::Debug: return "DEBUG";
		case LogLevel::Info: return "INFO";
		case LogLevel::Warn: return "WARN";
		case LogLevel::Error: return "ERROR";
		default: return "UNKNOWN";
		}
	}

	Logger& Logger::Get()
	{
		static Logger instance;
		return instance;
	}

	void Logger::SetLogLevel(LogLevel level)
	{
		std::lock_guard<std::mutex> lock(m_Mutex);
		m_MinLogLevel = level;
	}

	void Logger::AddSink(std::shared_ptr<ILogSink> sink)
	{
		std::lock_guard<std::mutex> lock(m_Mutex);
		m_Sinks.push_back(std::move(sink));
	}

	void Logger::ClearSinks()
	{
		std::lock_guard<std::mutex> lock(m_Mutex);
		m_Sinks.clear();
	}

	void Logger::Log(LogLevel level, const std::string& message)
	{
		if (level < m_MinLogLevel)
			return;

		auto now = std::chrono::system_clock::now();
		std::time_t time = std::chrono::system_clock::to_time_t(now);

		std::tm localTime{};
#ifdef _WIN32
		localtime_s(&localTime, &time);
#else
		localtime_r(&time, &localTime);
#endif

		std::stringstream ss;
		ss << std::put_time(&localTime, "%H:%M:%S");

		std::string fullMessage = std::format("[{}] [{}] {}", ss.str(), LogLevelToString(level), message);

		// Send to all sinks
		std::lock_guard<std::mutex> lock(m_Mutex);
		for (const auto& sink : m_Sinks)
		{
			sink->Write(level, fullMessage);
		}
	}
}
