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

#pragma once

#include <sstream>
#include <string>

#include "radio/http/Header.hpp"
#include "radio/http/URL.hpp"


namespace radio
{
	namespace http
	{
		struct Request
		{
			std::string method{"GET"};
			URL         url;
			Headers     headers;

			// HTTP/1.0 is used so servers never answer with chunked transfer encoding
			inline std::string toString() const
			{
				std::stringstream ss;

				ss << method << " " << url.getTarget() << " HTTP/1.0\r\n";
				if (headers.find("Host") == headers.end())
				{
					ss << "Host: " << url.getHost();
					if ((url.getScheme() == "http" && url.getPort() != 80) || (url.getScheme() == "https" && url.getPort() != 443))
					{
						ss << ":" << url.getPort();
					}
					ss << "\r\n";
				}
				if (headers.find("User-Agent") == headers.end())
				{
					ss << "User-Agent: RadioSource/" << VERSION << "\r\n";
				}
				for (auto& [name, value] : headers)
				{
					ss << name << ": " << value << "\r\n";
				}
				ss << "\r\n";

				return ss.str();
			}
		};
	}
}
