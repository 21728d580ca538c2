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

#include <limits>

#include "radio/http/HeaderParser.hpp"
#include "radio/log/log.hpp"


namespace radio
{
	namespace http
	{
		StreamDescriptor HeaderParser::parse(unsigned int status, const Headers& headers, const URL& url)
		{
			StreamDescriptor descriptor;

			// Content-Range carries the full length whereas Content-Length of a ranged response carries only the remainder
			auto contentRange{find(headers, "Content-Range")};
			ts::with(contentRange, [&](const auto& value)
			{
				descriptor.totalLength       = parseContentRangeTotal(value);
				descriptor.supportsByteRange = true;
			});

			// Content-Length of an error response describes the error page rather than the resource
			if (!descriptor.totalLength.has_value() && status < 300)
			{
				ts::with(find(headers, "Content-Length"), [&](const auto& value)
				{
					descriptor.totalLength = parseUnsigned(value);
				});
			}

			ts::with(find(headers, "Accept-Ranges"), [&](const auto& value)
			{
				if (toLower(value) != "none")
				{
					descriptor.supportsByteRange = true;
				}
			});

			if (status == 206)
			{
				descriptor.supportsByteRange = true;
			}

			ts::with(find(headers, "icy-metaint"), [&](const auto& value)
			{
				auto interval{parseUnsigned(value)};

				if (interval.has_value() && interval.value() > 0 && interval.value() <= std::numeric_limits<std::size_t>::max())
				{
					descriptor.metadataInterval = static_cast<std::size_t>(interval.value());
				}
				else
				{
					LOG(WARNING) << LABELS{"http"} << "Ignoring invalid icy-metaint header (value='" << value << "')";
				}
			});

			auto contentType{find(headers, "Content-Type")};
			if (contentType.has_value())
			{
				descriptor.mime            = contentType.value();
				descriptor.contentTypeHint = contentTypeFromMIME(contentType.value());
			}
			if (descriptor.contentTypeHint == ContentTypeSelection::Unknown)
			{
				descriptor.contentTypeHint = contentTypeFromExtension(url.getExtension());
			}

			descriptor.station.name  = find(headers, "icy-name");
			descriptor.station.genre = find(headers, "icy-genre");
			descriptor.station.url   = find(headers, "icy-url");
			ts::with(find(headers, "icy-br"), [&](const auto& value)
			{
				// some servers send a list like '128,128'
				auto bitrate{parseUnsigned(value.substr(0, value.find(',')))};

				if (bitrate.has_value() && bitrate.value() <= std::numeric_limits<unsigned int>::max())
				{
					descriptor.station.bitrate = static_cast<unsigned int>(bitrate.value());
				}
			});

			return descriptor;
		}

		ts::optional<std::uint64_t> HeaderParser::parseContentRangeTotal(const std::string& value)
		{
			auto result{ts::optional<std::uint64_t>{ts::nullopt}};
			auto slash{value.rfind('/')};

			// total is '*' when unknown, parseUnsigned rejects it
			if (slash != std::string::npos && toLower(trim(value)).rfind("bytes", 0) == 0)
			{
				result = parseUnsigned(value.substr(slash + 1));
			}

			return result;
		}

		ts::optional<std::uint64_t> HeaderParser::parseUnsigned(const std::string& value)
		{
			auto result{ts::optional<std::uint64_t>{ts::nullopt}};
			auto trimmed{trim(value)};

			if (!trimmed.empty() && trimmed.find_first_not_of("0123456789") == std::string::npos)
			{
				std::uint64_t number{0};
				auto          overflow{false};

				for (auto c : trimmed)
				{
					auto digit{static_cast<std::uint64_t>(c - '0')};

					if (number > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
					{
						overflow = true;
						break;
					}
					number = number * 10 + digit;
				}

				if (!overflow)
				{
					result = number;
				}
			}

			return result;
		}

		ts::optional<std::string> HeaderParser::find(const Headers& headers, const std::string& name)
		{
			auto result{ts::optional<std::string>{ts::nullopt}};
			auto found{headers.find(name)};

			if (found != headers.end())
			{
				result = trim(found->second);
			}

			return result;
		}
	}
}
