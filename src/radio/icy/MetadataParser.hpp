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
#include <type_safe/optional.hpp>

#include "radio/icy/Metadata.hpp"


namespace radio
{
	namespace icy
	{
		namespace ts = type_safe;

		class MetadataParserBase
		{
			public:
				// using Rule Of Zero
				MetadataParserBase() = default;
				virtual ~MetadataParserBase() = default;
				MetadataParserBase(const MetadataParserBase&) = delete;             // non-copyable
				MetadataParserBase& operator=(const MetadataParserBase&) = delete;  // non-assignable
				MetadataParserBase(MetadataParserBase&& rhs) = default;
				MetadataParserBase& operator=(MetadataParserBase&& rhs) = default;

				// returns nullopt if the record could not be decoded
				virtual ts::optional<Metadata> parse(const std::string& record) = 0;
		};

		// decodes "StreamTitle='Artist - Title';StreamUrl='';" records padded with zero bytes
		class MetadataParser : public MetadataParserBase
		{
			public:
				virtual ts::optional<Metadata> parse(const std::string& record) override;
		};
	}
}
