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

#include "radio/http/Header.hpp"
#include "radio/icy/MetadataParser.hpp"


namespace radio
{
	namespace icy
	{
		ts::optional<Metadata> MetadataParser::parse(const std::string& record)
		{
			auto result{ts::optional<Metadata>{ts::nullopt}};

			// records are padded up to a multiple of 16 bytes with zeros
			auto text{record.substr(0, record.find('\0'))};
			if (http::trim(text).empty())
			{
				return result;
			}

			Metadata metadata;
			auto     valid{true};
			for (std::size_t position{0}; valid && position < text.length();)
			{
				// skipping separators between pairs
				position = text.find_first_not_of("; \t\r\n", position);
				if (position == std::string::npos)
				{
					break;
				}

				auto equal{text.find('=', position)};
				if (equal == std::string::npos || equal == position)
				{
					valid = false;
					break;
				}
				auto key{http::trim(text.substr(position, equal - position))};

				// values are quoted and may contain quotes themselves, so a value ends with a quote followed by ';' or the end
				auto valueBegin{equal + 1};
				if (valueBegin < text.length() && text[valueBegin] == '\'')
				{
					valueBegin++;

					auto valueEnd{text.find("';", valueBegin)};
					if (valueEnd == std::string::npos)
					{
						auto lastQuote{text.rfind('\'')};
						if (lastQuote < valueBegin || lastQuote == std::string::npos)
						{
							valid = false;
							break;
						}
						valueEnd = lastQuote;
					}

					metadata[key] = text.substr(valueBegin, valueEnd - valueBegin);
					position      = valueEnd + 1;
				}
				else
				{
					// tolerating unquoted values
					auto valueEnd{text.find(';', valueBegin)};
					if (valueEnd == std::string::npos)
					{
						valueEnd = text.length();
					}

					metadata[key] = http::trim(text.substr(valueBegin, valueEnd - valueBegin));
					position      = valueEnd;
				}
			}

			if (valid && !metadata.empty())
			{
				result = std::move(metadata);
			}

			return result;
		}
	}
}
