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


namespace radio
{
	namespace source
	{
		// absolute position is always seekOffset + bytesReceived; seek resets one, streaming increments the other
		struct Position
		{
			std::uint64_t seekOffset{0};
			std::uint64_t bytesReceived{0};

			inline auto getAbsolute() const
			{
				return seekOffset + bytesReceived;
			}

			inline void reset(std::uint64_t offset)
			{
				seekOffset    = offset;
				bytesReceived = 0;
			}
		};
	}
}
