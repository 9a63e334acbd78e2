//------------------------------------------------------------------------------
// ResourceSetTests.cpp
//------------------------------------------------------------------------------

#include "TestHelpers.hpp"
#include "Glasswing/Core/Errors.hpp"
#include "Glasswing/Renderer/Buffer.hpp"
#include "Glasswing/Renderer/PipelineState/ResourceSet.hpp"

#include <stdexcept>

namespace Glasswing
{
	namespace
	{
		std::shared_ptr<Buffer> MakeBlock()
		{
			return std::make_shared<Buffer>(BufferRole::Constant, BufferUsage::Dynamic, 64, 1);
		}
	}

	TEST(ResourceSetTest, KeepsElementsAlive)
	{
		std::weak_ptr<Buffer> watcher;
		{
			ResourceSet<Buffer> set;
			{
				auto block = MakeBlock();
				watcher = block;
				set.Add(block);
			}
			EXPECT_FALSE(watcher.expired());
		}
		EXPECT_TRUE(watcher.expired());
	}

	TEST(ResourceSetTest, CopiesShareElements)
	{
		auto block = MakeBlock();
		ResourceSet<Buffer> set;
		set.Add(block);
		EXPECT_EQ(block.use_count(), 2);

		{
			ResourceSet<Buffer> copy = set;
			EXPECT_EQ(block.use_count(), 3);
			EXPECT_EQ(copy[0], block);
		}

		EXPECT_EQ(block.use_count(), 2);
	}

	TEST(ResourceSetTest, PreservesInsertionOrder)
	{
		auto a = MakeBlock();
		auto b = MakeBlock();
		auto c = MakeBlock();

		ResourceSet<Buffer> set;
		set.Add(b);
		set.Add(a);
		set.Add(c);
		set.Add(a);

		ASSERT_EQ(set.Size(), 4u);
		std::vector<std::shared_ptr<Buffer>> expected{ b, a, c, a };
		size_t i = 0;
		for (const auto& element : set)
			EXPECT_EQ(element, expected[i++]);

		EXPECT_THROW(set[4], std::out_of_range);
	}

	TEST(ResourceSetTest, RejectsNullHandles)
	{
		auto sink = std::make_shared<CaptureLogSink>();
		Logger::Get().ClearSinks();
		Logger::Get().AddSink(sink);

		ResourceSet<Buffer> set;
		EXPECT_THROW(set.Add(nullptr), PreconditionError);
		EXPECT_TRUE(set.IsEmpty());
		EXPECT_TRUE(sink->Contains(LogLevel::Error, "Null handle added to a resource set"));

		Logger::Get().ClearSinks();
	}

	TEST(ResourceSetTest, ClearDropsReferences)
	{
		auto block = MakeBlock();
		ResourceSet<Buffer> set;
		set.Add(block);
		set.Clear();

		EXPECT_TRUE(set.IsEmpty());
		EXPECT_EQ(block.use_count(), 1);
	}
}
