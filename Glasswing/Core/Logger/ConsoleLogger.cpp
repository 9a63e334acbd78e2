//------------------------------------------------------------------------------
// ConsoleLogger.cpp
//
// Console output implementation with color support
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------

#include "ConsoleLogger.hpp"
#include <iostream>

namespace Glasswing
{
	ConsoleLogger::ConsoleLogger(bool useColors)
		: m_UseColors(useColors)
	{
	}

	void ConsoleLogger::Write(LogLevel level, const std::string& message)
	{
		std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;

		if (m_UseColors)
			out << GetColorCode(level) << message << "\033[0m" << std::endl;
		else
			out << message << std::endl;
	}

	// ANSI escape codes, supported by modern Windows terminals as well
	const char* ConsoleLogger::GetColorCode(LogLevel level)
	{
		switch (level)
		{
		case LogLevel::Trace: return "\033[90m"; // Gray
		case LogLevel::Debug: return "\033[36m"; // Cyan
		case LogLevel::Info:  return "\033[37m"; // White
		case LogLevel::Warn:  return "\033[33m"; // Yellow
		case LogLevel::Error: return "\033[91m"; // Red
		default:              return "";
		}
	}
}
