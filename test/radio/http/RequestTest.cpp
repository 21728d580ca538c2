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

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>

#include "radio/http/Request.hpp"


using namespace radio::http;


TEST(RequestTest, ToString1)
{
	Request request;

	request.url     = URL::parse("http://radio.example.com:8000/stream?x=1");
	request.headers = Headers
	{
		{"Icy-MetaData", "1"},
		{"User-Agent",   "Tester"},
	};

	EXPECT_EQ(request.toString(),
		"GET /stream?x=1 HTTP/1.0\r\n"
		"Host: radio.example.com:8000\r\n"
		"Icy-MetaData: 1\r\n"
		"User-Agent: Tester\r\n"
		"\r\n");
}

TEST(RequestTest, ToString2)
{
	Request request;

	request.url = URL::parse("http://radio.example.com/stream");

	auto text = request.toString();

	EXPECT_EQ(text.find("GET /stream HTTP/1.0\r\nHost: radio.example.com\r\n"), 0u);
	EXPECT_NE(text.find("User-Agent: RadioSource/"), std::string::npos);
	EXPECT_EQ(text.substr(text.length() - 4), "\r\n\r\n");
}
