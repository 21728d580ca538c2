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

#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>

#include "radio/source/OutputDelegate.hpp"
#include "radio/source/RemoteSourceTest.hpp"


using radio::http::Headers;
using radio::source::ConsumerMode;
using radio::source::OutputDelegate;


struct OutputDelegateFixture : public RemoteSourceFixture
{
	~OutputDelegateFixture()
	{
		processAndWait([&]
		{
			outputSourcePtr.reset();
		});
	}

	void createOutputSource(ConsumerMode mode, std::uint64_t seekOffset)
	{
		outputDelegatePtr = std::make_shared<OutputDelegate>(output, seekOffset);
		processAndWait([&]
		{
			outputSourcePtr = std::make_unique<SourceTest>(processor.getProcessorProxy(), std::ref(transport), outputDelegatePtr, mode, 1024);
			outputSourcePtr->open("http://example.com/track.mp3", Headers{});
		});
	}

	std::string readAllOutput()
	{
		std::string  result;
		std::uint8_t buffer[7];
		std::size_t  size;

		while ((size = outputSourcePtr->read(buffer, sizeof(buffer))) > 0)
		{
			result.append(reinterpret_cast<const char*>(buffer), size);
		}

		return result;
	}

	std::stringstream               output;
	std::shared_ptr<OutputDelegate> outputDelegatePtr;
	std::unique_ptr<SourceTest>     outputSourcePtr;
};


TEST_F(OutputDelegateFixture, Seek1)
{
	createOutputSource(ConsumerMode::Push, 0);

	EXPECT_TRUE(outputDelegatePtr->isReadable());

	processAndWait([&]
	{
		transport.sendHeader(1, 200, Headers{});
		transport.sendData(1, "abcd");
	});

	EXPECT_EQ(output.str(), "abcd");
	EXPECT_EQ(transport.requests.size(), 1u);
}

TEST_F(OutputDelegateFixture, Seek2)
{
	createOutputSource(ConsumerMode::Push, 100);

	// first chunk is kept when the resource cannot be repositioned
	processAndWait([&]
	{
		transport.sendHeader(1, 200, Headers{{"Accept-Ranges", "none"}});
		transport.sendData(1, "abcd");
		transport.sendData(1, "efgh");
	});

	EXPECT_EQ(output.str(), "abcdefgh");
	EXPECT_EQ(transport.requests.size(), 1u);
	EXPECT_TRUE(outputDelegatePtr->isReadable());
}

TEST_F(OutputDelegateFixture, Seek3)
{
	createOutputSource(ConsumerMode::Push, 100);

	processAndWait([&]
	{
		transport.sendHeader(1, 200, Headers{{"Accept-Ranges", "bytes"}, {"Content-Length", "2000"}});
		transport.sendData(1, "abcd");
	});

	ASSERT_EQ(transport.requests.size(), 2u);
	EXPECT_EQ(transport.requests[1].request.headers.at("Range"), "bytes=100-");
	EXPECT_TRUE(output.str().empty());

	processAndWait([&]
	{
		transport.sendHeader(2, 206, Headers{{"Content-Range", "bytes 100-1999/2000"}});
		transport.sendData(2, "xyz");
	});

	EXPECT_EQ(output.str(), "xyz");
	EXPECT_EQ(outputSourcePtr->getPosition(), 103u);
}

TEST_F(OutputDelegateFixture, Seek4)
{
	createOutputSource(ConsumerMode::Pull, 100);

	// reader must wait for the seek decision
	EXPECT_FALSE(outputDelegatePtr->isReadable());

	processAndWait([&]
	{
		transport.sendHeader(1, 200, Headers{{"Accept-Ranges", "bytes"}, {"Content-Length", "2000"}});
		transport.sendData(1, "abcd");
	});

	EXPECT_TRUE(outputDelegatePtr->isReadable());
	ASSERT_EQ(transport.requests.size(), 2u);

	// bytes from the start of the resource never reach the reader
	EXPECT_EQ(readAllOutput(), "");

	processAndWait([&]
	{
		transport.sendHeader(2, 206, Headers{{"Content-Range", "bytes 100-1999/2000"}});
		transport.sendData(2, "xyz");
	});

	EXPECT_EQ(readAllOutput(), "xyz");
	EXPECT_EQ(outputSourcePtr->getPosition(), 103u);
	EXPECT_TRUE(output.str().empty());
}

TEST_F(OutputDelegateFixture, Seek5)
{
	createOutputSource(ConsumerMode::Pull, 100);

	processAndWait([&]
	{
		transport.sendHeader(1, 200, Headers{{"Accept-Ranges", "none"}});
		transport.sendData(1, "abcd");
	});

	EXPECT_TRUE(outputDelegatePtr->isReadable());
	EXPECT_EQ(transport.requests.size(), 1u);
	EXPECT_EQ(readAllOutput(), "abcd");
}

TEST_F(OutputDelegateFixture, Finish1)
{
	createOutputSource(ConsumerMode::Push, 0);

	processAndWait([&]
	{
		transport.sendHeader(1, 500, Headers{});
	});

	EXPECT_TRUE(outputDelegatePtr->isFinished());
	EXPECT_TRUE(outputDelegatePtr->isFailed());
}
