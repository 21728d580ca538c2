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

#include <algorithm>
#include <cctype>

#include "radio/log/SinkFilter.hpp"


namespace radio
{
	namespace log
	{
		std::string rightTrim(const std::string& s)
		{
			auto r = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c)
			{
				return std::isspace(c);
			}).base();

			return std::string(s.begin(), r);
		}

		SinkFilter::SinkFilter(std::function<bool(g3::LogMessage&)> f)
		: filterFunction{std::move(f)} {}

		bool SinkFilter::filter(g3::LogMessage& logMessage) const
		{
			// message is skipped only if a filter is set and it rejects the message
			return (filterFunction && filterFunction(logMessage));
		}
	}
}
