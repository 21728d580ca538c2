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

#include <chrono>
#include <conwrap2/Processor.hpp>
#include <conwrap2/ProcessorProxy.hpp>
#include <experimental/net>
#include <future>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <ofats/invocable.h>
#include <string>
#include <thread>

#include "radio/ContainerBase.hpp"
#include "radio/http/Client.hpp"


struct ClientFixture : public ::testing::Test
{
	struct ContainerMock : public radio::ContainerBase
	{
		virtual void start() override {}
		virtual void stop() override {}
	};

	// accepts one connection, reads the request and answers with a canned response
	struct ServerMock
	{
		ServerMock(std::string re)
		: response{std::move(re)}
		, acceptor{context, std::experimental::net::ip::tcp::endpoint{std::experimental::net::ip::address_v4::loopback(), 0}}
		, thread{[&]
		{
			std::error_code error;
			auto socket{acceptor.accept(error)};
			if (error)
			{
				return;
			}

			char buffer[1024];
			while (request.find("\r\n\r\n") == std::string::npos)
			{
				auto size{socket.read_some(std::experimental::net::buffer(buffer), error)};
				if (error)
				{
					return;
				}
				request.append(buffer, size);
			}

			std::experimental::net::write(socket, std::experimental::net::buffer(response), error);
			socket.shutdown(std::experimental::net::socket_base::shutdown_both, error);
			socket.close(error);
		}} {}

		~ServerMock()
		{
			thread.join();
		}

		inline auto getPort()
		{
			return acceptor.local_endpoint().port();
		}

		std::string                               response;
		std::string                               request;
		std::experimental::net::io_context        context;
		std::experimental::net::ip::tcp::acceptor acceptor;
		std::thread                               thread;
	};

	using Processor = conwrap2::Processor<std::unique_ptr<radio::ContainerBase>>;

	~ClientFixture()
	{
		processAndWait([&]
		{
			clientPtr.reset();
		});

		// processor must be destroyed FIRST as it may contain references to other object
		processorPtr.reset();
	}

	void processAndWait(ofats::any_invocable<void()>&& handler)
	{
		auto p = std::promise<bool>{};
		auto f = p.get_future();
		processor.process([handler = std::move(handler), p = std::move(p)]() mutable
		{
			handler();
			p.set_value(true);
		});

		f.wait();
	}

	// issues a request and waits for it to complete or fail
	void requestAndWait(const std::string& url)
	{
		processAndWait([&]
		{
			clientPtr = std::make_unique<radio::http::Client>(processor.getProcessorProxy(), 8);

			radio::http::Request request;
			request.url = radio::http::URL::parse(url);
			request.headers.insert_or_assign("Icy-MetaData", "1");

			radio::http::Callbacks callbacks;
			callbacks.setHeaderCallback([&](auto, auto st, auto& he)
			{
				status  = st;
				headers = he;
			});
			callbacks.setDataCallback([&](auto, auto* data, auto size)
			{
				EXPECT_LE(size, 8u);
				body.append(reinterpret_cast<const char*>(data), size);
			});
			callbacks.setCompleteCallback([&](auto)
			{
				completed = true;
				done.set_value(true);
			});
			callbacks.setFailureCallback([&](auto, auto& message)
			{
				failure = message;
				done.set_value(true);
			});

			clientPtr->request(std::move(request), std::move(callbacks));
		});

		ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds{5}), std::future_status::ready);
	}

	std::unique_ptr<Processor> processorPtr{std::make_unique<Processor>([&](auto processorProxy)
	{
		return std::unique_ptr<radio::ContainerBase>
		{
			new ContainerMock
		};
	})};
	Processor&                           processor{*(processorPtr.get())};
	std::unique_ptr<radio::http::Client> clientPtr;
	std::promise<bool>                   done;
	unsigned int                         status{0};
	radio::http::Headers                 headers;
	std::string                          body;
	bool                                 completed{false};
	std::string                          failure;
};


TEST_F(ClientFixture, Request1)
{
	ServerMock server{"ICY 200 OK\r\nicy-metaint: 8192\r\nContent-Type: audio/mpeg\r\n\r\nsome audio bytes"};

	requestAndWait("http://127.0.0.1:" + std::to_string(server.getPort()) + "/stream");

	EXPECT_TRUE(completed);
	EXPECT_EQ(status, 200u);
	EXPECT_EQ(headers.at("ICY-METAINT"), "8192");
	EXPECT_EQ(headers.at("content-type"), "audio/mpeg");
	EXPECT_EQ(body, "some audio bytes");
	EXPECT_EQ(server.request.find("GET /stream HTTP/1.0\r\n"), 0u);
	EXPECT_NE(server.request.find("Icy-MetaData: 1\r\n"), std::string::npos);
}

TEST_F(ClientFixture, Request2)
{
	// bytes beyond Content-Length are not a part of the body
	ServerMock server{"HTTP/1.1 206 Partial Content\r\nContent-Length: 5\r\nContent-Range: bytes 10-14/15\r\n\r\n0123456789"};

	requestAndWait("http://127.0.0.1:" + std::to_string(server.getPort()) + "/file.mp3");

	EXPECT_TRUE(completed);
	EXPECT_EQ(status, 206u);
	EXPECT_EQ(body, "01234");
}

TEST_F(ClientFixture, Request3)
{
	ServerMock server{"HTTP/1.1 200 OK\r\nContent-Length: 50\r\n\r\nshort"};

	requestAndWait("http://127.0.0.1:" + std::to_string(server.getPort()) + "/");

	EXPECT_FALSE(completed);
	EXPECT_FALSE(failure.empty());
	EXPECT_EQ(body, "short");
}

TEST_F(ClientFixture, Request4)
{
	ServerMock server{"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n0\r\n\r\n"};

	requestAndWait("http://127.0.0.1:" + std::to_string(server.getPort()) + "/");

	EXPECT_FALSE(completed);
	EXPECT_FALSE(failure.empty());
	EXPECT_TRUE(body.empty());
}

TEST_F(ClientFixture, Request5)
{
	ServerMock server{"garbage\r\n\r\n"};

	requestAndWait("http://127.0.0.1:" + std::to_string(server.getPort()) + "/");

	EXPECT_FALSE(completed);
	EXPECT_FALSE(failure.empty());
	EXPECT_EQ(status, 0u);
}

TEST_F(ClientFixture, Request6)
{
	// TLS is not provided by this transport
	requestAndWait("https://127.0.0.1/");

	EXPECT_FALSE(completed);
	EXPECT_NE(failure.find("https"), std::string::npos);
}

TEST_F(ClientFixture, Request7)
{
	unsigned short port;
	{
		// taking a port nobody listens on
		std::experimental::net::io_context        context;
		std::experimental::net::ip::tcp::acceptor acceptor{context, std::experimental::net::ip::tcp::endpoint{std::experimental::net::ip::address_v4::loopback(), 0}};
		port = acceptor.local_endpoint().port();
	}

	requestAndWait("http://127.0.0.1:" + std::to_string(port) + "/");

	EXPECT_FALSE(completed);
	EXPECT_FALSE(failure.empty());
}
