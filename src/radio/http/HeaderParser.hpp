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

#include <cstdint>  // std::uint64_t
#include <string>
#include <type_safe/optional.hpp>

#include "radio/http/Header.hpp"
#include "radio/http/StreamDescriptor.hpp"
#include "radio/http/URL.hpp"


namespace radio
{
	namespace http
	{
		namespace ts = type_safe;

		class HeaderParser
		{
			public:
				// never fails: missing or malformed headers leave descriptor defaults in place
				static StreamDescriptor parse(unsigned int status, const Headers& headers, const URL& url);

				static ts::optional<std::uint64_t> parseContentRangeTotal(const std::string& value);
				static ts::optional<std::uint64_t> parseUnsigned(const std::string& value);

			protected:
				static ts::optional<std::string> find(const Headers& headers, const std::string& name);
		};
	}
}
