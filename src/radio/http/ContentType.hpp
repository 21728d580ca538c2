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

#include <ostream>
#include <string>


namespace radio
{
	namespace http
	{
		// container format hint for selecting a downstream decoder
		enum class ContentTypeSelection
		{
			Unknown,
			MP3,
			AAC,
			MP4,
			OGG,
			FLAC,
			WAVE,
			AIFF,
			CAF,
		};

		ContentTypeSelection contentTypeFromMIME(const std::string& mime);
		ContentTypeSelection contentTypeFromExtension(const std::string& extension);
		const char*          toString(ContentTypeSelection contentType);

		inline std::ostream& operator<<(std::ostream& os, ContentTypeSelection contentType)
		{
			return os << toString(contentType);
		}
	}
}
