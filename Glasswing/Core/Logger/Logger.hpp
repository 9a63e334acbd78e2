//------------------------------------------------------------------------------
// Logger.hpp
//
// Core logging system for Glasswing
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <vector>
#include <mutex>
#include <format>

namespace Glasswing
{
	enum class LogLevel
	{
		Trace,
		Debug,
		Info,
		Warn,
		Error,
		None
	};

	const char* LogLevelToString(LogLevel level);

	class ILogSink;

	// a singleton logger class that will handle logging messages
	class Logger
	{
	public:
		
		// singleton instance access
		static Logger& Get();

		// config
		void SetLogLevel(LogLevel level);
		void AddSink(std::shared_ptr<ILogSink> sink);
		void ClearSinks();

		// Core Logging Function
		void Log(LogLevel level, const std::string& message);

		//Formatted logging 
		template<typename... Args>
		void LogFormatted(LogLevel level, std::string_view format, Args&&... args)
		{
			if (level < m_MinLogLevel)
				return;

			if constexpr (sizeof...(args) == 0)
			{
				Log(level, std::string(format));
			}
			else
			{
				Log(level, std::vformat(format, std::make_format_args(args...)));
			}
		}

	private:
		Logger() = default;
		~Logger() = default;
		Logger(const Logger&) = delete;
		Logger& operator=(const Logger&) = delete;

		LogLevel m_MinLogLevel = LogLevel::Trace;
		std::vector<std::shared_ptr<ILogSink>> m_Sinks;
		std::mutex m_Mutex;
	};

	// sink interface for logging
	class ILogSink
	{
	public:
		virtual ~ILogSink() = default;
		virtual void Write(LogLevel level, const std::string& message) = 0;
	};
}

// Convenience macros for logging
#define LOG_TRACE(...) ::Glasswing::Logger::Get().LogFormatted(::Glasswing::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::Glasswing::Logger::Get().LogFormatted(::Glasswing::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...)  ::Glasswing::Logger::Get().LogFormatted(::Glasswing::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)  ::Glasswing::Logger::Get().LogFormatted(::Glasswing::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::Glasswing::Logger::Get().LogFormatted(::Glasswing::LogLevel::Error, __VA_ARGS__)
