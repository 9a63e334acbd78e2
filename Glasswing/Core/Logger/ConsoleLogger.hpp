//------------------------------------------------------------------------------
// ConsoleLogger.hpp
//
// Console output sink for logging system
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------

#pragma once

#include "Logger.hpp"

namespace Glasswing
{
	// Warnings and errors go to stderr, everything else to stdout
	class ConsoleLogger : public ILogSink
	{
	public:
		ConsoleLogger(bool useColors = true);
		virtual ~ConsoleLogger() = default;

		// ILogSink interface implementation
		virtual void Write(LogLevel level, const std::string& message) override;

	private:
		bool m_UseColors;

		static const char* GetColorCode(LogLevel level);
	};
}
