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

#include <string>


namespace radio
{
	namespace http
	{
		class URL
		{
			public:
				URL() = default;

				// using Rule Of Zero
			   ~URL() = default;
				URL(const URL&) = default;
				URL& operator=(const URL&) = default;
				URL(URL&& rhs) = default;
				URL& operator=(URL&& rhs) = default;

				// throws radio::Exception if provided string is not an absolute http(s) URL
				static URL parse(const std::string& url);

				inline const auto& getHost() const
				{
					return host;
				}

				// lower case extension of the last path segment without a dot, empty if there is none
				std::string getExtension() const;

				inline const auto& getPath() const
				{
					return path;
				}

				inline auto getPort() const
				{
					return port;
				}

				inline const auto& getQuery() const
				{
					return query;
				}

				inline const auto& getScheme() const
				{
					return scheme;
				}

				// request target as sent in the request line
				std::string getTarget() const;

				std::string toString() const;

			private:
				std::string    scheme;
				std::string    host;
				unsigned short port{0};
				std::string    path{"/"};
				std::string    query;
		};
	}
}
