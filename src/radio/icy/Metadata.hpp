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

#include <map>
#include <string>


namespace radio
{
	namespace icy
	{
		// key/value pairs of one metadata record, e.g. {StreamTitle: "Artist - Title"}
		using Metadata = std::map<std::string, std::string>;
	}
}
