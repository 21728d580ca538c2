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

#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint64_t
#include <string>
#include <type_safe/optional.hpp>

#include "radio/http/ContentType.hpp"


namespace radio
{
	namespace http
	{
		namespace ts = type_safe;

		// station details some streaming servers announce with icy-* headers
		struct StationInfo
		{
			ts::optional<std::string>  name{ts::nullopt};
			ts::optional<std::string>  genre{ts::nullopt};
			ts::optional<std::string>  url{ts::nullopt};
			ts::optional<unsigned int> bitrate{ts::nullopt};
		};

		// what response headers tell about a resource; produced once per connection
		struct StreamDescriptor
		{
			ts::optional<std::uint64_t> totalLength{ts::nullopt};
			bool                        supportsByteRange{false};
			ts::optional<std::size_t>   metadataInterval{ts::nullopt};
			ContentTypeSelection        contentTypeHint{ContentTypeSelection::Unknown};
			std::string                 mime;
			StationInfo                 station;
		};
	}
}
