/*
 * Copyright 2017, Andrej Kislovskij
 *
 * This is PUBLIC DOMAIN software so use at your own risk as it comes
 * with no warranties. This code is yours to share, use and modify without
 * any restrictions or obligations.
 *
 * For more information see conwrap/LICENSE or refer refer to http://unlicense.org
 *
 * Author: gimesketvirtadieni at gmail dot com (Andrej Kislovskij)
 */

#include <cstdint>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "radio/util/SharedBuffer.hpp"


TEST(SharedBufferTest, Write1)
{
	radio::util::SharedBuffer buffer{4};
	std::uint8_t              data[] = {1, 2, 3, 4, 5};

	EXPECT_EQ(buffer.write(data, 5), 4);
	EXPECT_EQ(buffer.getSize(), 4);
	EXPECT_EQ(buffer.getFreeSize(), 0);
	EXPECT_EQ(buffer.getCapacity(), 4);
}

TEST(SharedBufferTest, Read1)
{
	radio::util::SharedBuffer buffer{4};
	std::uint8_t              data[] = {1, 2, 3};
	std::uint8_t              destination[4];
	std::size_t               readSize{0};
	std::size_t               freeSize{0};

	buffer.write(data, 3);
	auto result = buffer.read(destination, 2, [&](auto r, auto f)
	{
		readSize = r;
		freeSize = f;
	});

	EXPECT_EQ(result, 2);
	EXPECT_EQ(readSize, 2);
	EXPECT_EQ(freeSize, 3);
	EXPECT_EQ(destination[0], 1);
	EXPECT_EQ(destination[1], 2);
}

TEST(SharedBufferTest, Read2)
{
	radio::util::SharedBuffer buffer{4};
	std::uint8_t              destination[4];
	auto                      called{false};

	// callback is invoked even if nothing was read
	EXPECT_EQ(buffer.read(destination, 4, [&](auto r, auto)
	{
		called = true;
		EXPECT_EQ(r, 0);
	}), 0);
	EXPECT_TRUE(called);
}

TEST(SharedBufferTest, Clear1)
{
	radio::util::SharedBuffer buffer{4};
	std::uint8_t              data[] = {1, 2, 3};
	auto                      counter{5};

	buffer.write(data, 3);
	buffer.clear([&]
	{
		counter = 0;
	});

	EXPECT_EQ(buffer.getSize(), 0);
	EXPECT_EQ(counter, 0);
}

TEST(SharedBufferTest, Synchronize1)
{
	radio::util::SharedBuffer buffer{4};

	EXPECT_EQ(buffer.synchronize([]
	{
		return 7;
	}), 7);
}

TEST(SharedBufferTest, Concurrency1)
{
	radio::util::SharedBuffer buffer{64};
	std::vector<std::uint8_t> received;
	std::size_t               total{10000};

	std::thread producer{[&]
	{
		for (std::size_t i{0}; i < total;)
		{
			auto value{static_cast<std::uint8_t>(i % 251)};
			i += buffer.write(&value, 1);
		}
	}};

	std::uint8_t destination[16];
	while (received.size() < total)
	{
		auto size = buffer.read(destination, sizeof(destination), [](auto, auto) {});
		received.insert(received.end(), destination, destination + size);
	}
	producer.join();

	// bytes come out in the order they went in
	for (std::size_t i{0}; i < total; i++)
	{
		ASSERT_EQ(received[i], static_cast<std::uint8_t>(i % 251));
	}
}
