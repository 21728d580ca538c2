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

#include <algorithm>  // std::lexicographical_compare
#include <cctype>     // std::tolower
#include <map>
#include <string>


namespace radio
{
	namespace http
	{
		// HTTP header names are case-insensitive
		struct CaseInsensitiveLess
		{
			inline bool operator()(const std::string& lhs, const std::string& rhs) const
			{
				return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](unsigned char l, unsigned char r)
				{
					return std::tolower(l) < std::tolower(r);
				});
			}
		};

		using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

		inline auto toLower(std::string s)
		{
			std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
			{
				return static_cast<char>(std::tolower(c));
			});

			return s;
		}

		inline auto trim(const std::string& s)
		{
			auto first{s.find_first_not_of(" \t\r\n")};
			auto last{s.find_last_not_of(" \t\r\n")};

			return (first == std::string::npos ? std::string{} : s.substr(first, last - first + 1));
		}
	}
}
