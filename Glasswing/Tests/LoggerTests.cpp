//------------------------------------------------------------------------------
// LoggerTests.cpp
//
// Unit tests for logging system and assert handling
// Copyright (c) 2024 Your Name. All rights reserved.
//------------------------------------------------------------------------------

#include <gtest/gtest.h>
#include "Glasswing/Core/Assert.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Core/Logger/FileLogger.hpp"
#include "Glasswing/Core/Logger/Logger.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Glasswing
{
	class TestLogSink : public ILogSink
	{
	public:
		virtual void Write(LogLevel level, const std::string& message) override
		{
			m_LastLevel = level;
			m_LastMessage = message;
			m_MessageCount++;
		}

		LogLevel m_LastLevel = LogLevel::None;
		std::string m_LastMessage;
		int m_MessageCount = 0;
	};

	class LoggerTest : public ::testing::Test
	{
	protected:
		void SetUp() override
		{
			// Clear any existing sinks and set up a test sink
			Logger::Get().ClearSinks();

			// Create a test sink to capture log messages
			m_TestSink = std::make_shared<TestLogSink>();
			Logger::Get().AddSink(m_TestSink);
			Logger::Get().SetLogLevel(LogLevel::Trace);
		}

		void TearDown() override
		{
			Logger::Get().ClearSinks();
			Debug::SetAssertHandler(nullptr);
		}

		std::shared_ptr<TestLogSink> m_TestSink;
	};

	TEST_F(LoggerTest, BasicLogging)
	{
		LOG_INFO("Test message");

		EXPECT_EQ(m_TestSink->m_LastLevel, LogLevel::Info);
		EXPECT_TRUE(m_TestSink->m_LastMessage.find("Test message") != std::string::npos);
		EXPECT_TRUE(m_TestSink->m_LastMessage.find("[INFO]") != std::string::npos);
		EXPECT_EQ(m_TestSink->m_MessageCount, 1);
	}

	TEST_F(LoggerTest, LogLevels)
	{
		Logger::Get().SetLogLevel(LogLevel::Warn);

		LOG_TRACE("Should not appear");
		LOG_DEBUG("Should not appear");
		LOG_INFO("Should not appear");

		EXPECT_EQ(m_TestSink->m_MessageCount, 0);

		LOG_WARN("Should appear");
		EXPECT_EQ(m_TestSink->m_MessageCount, 1);

		LOG_ERROR("Should also appear");
		EXPECT_EQ(m_TestSink->m_MessageCount, 2);
	}

	TEST_F(LoggerTest, NoneSilencesEverything)
	{
		Logger::Get().SetLogLevel(LogLevel::None);
		LOG_ERROR("Should not appear");
		EXPECT_EQ(m_TestSink->m_MessageCount, 0);
	}

	TEST_F(LoggerTest, Formatting)
	{
		int value = 42;
		float pi = 3.14f;

		LOG_INFO("Value: {}, Pi: {:.2f}", value, pi);

		EXPECT_TRUE(m_TestSink->m_LastMessage.find("Value: 42") != std::string::npos);
		EXPECT_TRUE(m_TestSink->m_LastMessage.find("Pi: 3.14") != std::string::npos);
	}

	TEST_F(LoggerTest, LevelNames)
	{
		EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
		EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
		EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
	}

	TEST_F(LoggerTest, FileSinkAppendsMessages)
	{
		std::string path = ::testing::TempDir() + "glasswing_logger_test.log";
		std::remove(path.c_str());

		{
			auto fileSink = std::make_shared<FileLogger>(path);
			EXPECT_TRUE(fileSink->IsOpen());
			EXPECT_EQ(fileSink->GetFilename(), path);

			Logger::Get().AddSink(fileSink);
			LOG_WARN("Written to {}", "disk");
			Logger::Get().ClearSinks();
		}

		std::ifstream file(path);
		std::stringstream contents;
		contents << file.rdbuf();
		EXPECT_NE(contents.str().find("Written to disk"), std::string::npos);

		std::remove(path.c_str());
	}

	TEST_F(LoggerTest, FileSinkThrowsOnBadPath)
	{
		EXPECT_THROW(FileLogger("/nonexistent-directory/glasswing.log"), std::runtime_error);
	}

	TEST_F(LoggerTest, PreconditionLogsAndThrows)
	{
		auto check = [](int size) {
			GLASSWING_CHECK_PRECONDITION(size == 16, "expected {} bytes, got {}", 16, size);
		};

		EXPECT_NO_THROW(check(16));
		EXPECT_EQ(m_TestSink->m_MessageCount, 0);

		try
		{
			check(15);
			FAIL() << "precondition did not throw";
		}
		catch (const PreconditionError& e)
		{
			EXPECT_STREQ(e.what(), "expected 16 bytes, got 15");
		}

		EXPECT_EQ(m_TestSink->m_LastLevel, LogLevel::Error);
		EXPECT_NE(m_TestSink->m_LastMessage.find("size == 16"), std::string::npos);
	}

	TEST_F(LoggerTest, VerifyCallsInstalledHandler)
	{
		std::string seenCondition;
		Debug::SetAssertHandler([&seenCondition](const char* condition, const char*, const char*, int, const char*) {
			seenCondition = condition;
		});

		int before = Debug::GetTotalAssertCount();
		VERIFY(1 + 1 == 3, "arithmetic is {}", "broken");

		EXPECT_EQ(seenCondition, "1 + 1 == 3");
		EXPECT_EQ(Debug::GetTotalAssertCount(), before + 1);
		EXPECT_NE(m_TestSink->m_LastMessage.find("arithmetic is broken"), std::string::npos);
	}
}
