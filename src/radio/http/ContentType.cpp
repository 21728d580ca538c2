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

#include <unordered_map>

#include "radio/http/ContentType.hpp"
#include "radio/http/Header.hpp"


namespace radio
{
	namespace http
	{
		ContentTypeSelection contentTypeFromMIME(const std::string& mime)
		{
			static const std::unordered_map<std::string, ContentTypeSelection> types
			{
				{"audio/mpeg",       ContentTypeSelection::MP3},
				{"audio/mp3",        ContentTypeSelection::MP3},
				{"audio/mpeg3",      ContentTypeSelection::MP3},
				{"audio/x-mpeg",     ContentTypeSelection::MP3},
				{"audio/aac",        ContentTypeSelection::AAC},
				{"audio/aacp",       ContentTypeSelection::AAC},
				{"audio/x-aac",      ContentTypeSelection::AAC},
				{"audio/mp4",        ContentTypeSelection::MP4},
				{"audio/m4a",        ContentTypeSelection::MP4},
				{"audio/x-m4a",      ContentTypeSelection::MP4},
				{"audio/ogg",        ContentTypeSelection::OGG},
				{"audio/opus",       ContentTypeSelection::OGG},
				{"application/ogg",  ContentTypeSelection::OGG},
				{"audio/flac",       ContentTypeSelection::FLAC},
				{"audio/x-flac",     ContentTypeSelection::FLAC},
				{"audio/wav",        ContentTypeSelection::WAVE},
				{"audio/wave",       ContentTypeSelection::WAVE},
				{"audio/x-wav",      ContentTypeSelection::WAVE},
				{"audio/x-wave",     ContentTypeSelection::WAVE},
				{"audio/aiff",       ContentTypeSelection::AIFF},
				{"audio/x-aiff",     ContentTypeSelection::AIFF},
				{"audio/x-caf",      ContentTypeSelection::CAF},
			};

			// parameters like '; charset=...' are not relevant
			auto result{ContentTypeSelection::Unknown};
			auto found{types.find(toLower(trim(mime.substr(0, mime.find(';')))))};
			if (found != types.end())
			{
				result = found->second;
			}

			return result;
		}

		ContentTypeSelection contentTypeFromExtension(const std::string& extension)
		{
			static const std::unordered_map<std::string, ContentTypeSelection> types
			{
				{"mp3",  ContentTypeSelection::MP3},
				{"aac",  ContentTypeSelection::AAC},
				{"m4a",  ContentTypeSelection::MP4},
				{"mp4",  ContentTypeSelection::MP4},
				{"ogg",  ContentTypeSelection::OGG},
				{"oga",  ContentTypeSelection::OGG},
				{"opus", ContentTypeSelection::OGG},
				{"flac", ContentTypeSelection::FLAC},
				{"wav",  ContentTypeSelection::WAVE},
				{"aif",  ContentTypeSelection::AIFF},
				{"aiff", ContentTypeSelection::AIFF},
				{"aifc", ContentTypeSelection::AIFF},
				{"caf",  ContentTypeSelection::CAF},
			};

			auto result{ContentTypeSelection::Unknown};
			auto found{types.find(toLower(extension))};
			if (found != types.end())
			{
				result = found->second;
			}

			return result;
		}

		const char* toString(ContentTypeSelection contentType)
		{
			switch (contentType)
			{
				case ContentTypeSelection::MP3:
					return "mp3";
				case ContentTypeSelection::AAC:
					return "aac";
				case ContentTypeSelection::MP4:
					return "m4a";
				case ContentTypeSelection::OGG:
					return "ogg";
				case ContentTypeSelection::FLAC:
					return "flac";
				case ContentTypeSelection::WAVE:
					return "wav";
				case ContentTypeSelection::AIFF:
					return "aiff";
				case ContentTypeSelection::CAF:
					return "caf";
				default:
					return "unknown";
			}
		}
	}
}
