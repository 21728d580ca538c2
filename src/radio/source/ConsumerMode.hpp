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


namespace radio
{
	namespace source
	{
		enum class ConsumerMode
		{
			// bytes are kept in the read buffer until the decoder calls read()
			Pull,
			// bytes are handed to the delegate as soon as they arrive
			Push,
		};
	}
}
