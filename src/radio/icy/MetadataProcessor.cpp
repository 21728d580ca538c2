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

#include <algorithm>  // std::min
#include <cstring>    // std::memcpy, std::memmove
#include <string>

#include "radio/icy/MetadataProcessor.hpp"
#include "radio/log/log.hpp"


namespace radio
{
	namespace icy
	{
		MetadataProcessor::MetadataProcessor(std::unique_ptr<MetadataParserBase> p)
		: parserPtr{std::move(p)} {}

		std::size_t MetadataProcessor::processInPlace(std::uint8_t* data, std::size_t size)
		{
			if (!isEnabled())
			{
				return size;
			}

			// audio is written behind the read position so compaction never overtakes unread input
			std::size_t audioSize{0};
			for (std::size_t offset{0}, part; offset < size; offset += part)
			{
				if (bytesUntilNextMetadata > 0)
				{
					part = std::min(bytesUntilNextMetadata, size - offset);
					if (audioSize != offset)
					{
						std::memmove(data + audioSize, data + offset, part);
					}

					audioSize              += part;
					bytesUntilNextMetadata -= part;
				}
				else if (pendingRecordSize > 0)
				{
					part = std::min(pendingRecordSize, size - offset);
					std::memcpy(recordBuffer.getData() + recordSize, data + offset, part);

					recordSize        += part;
					pendingRecordSize -= part;

					if (!pendingRecordSize)
					{
						onRecord(audioSize);
					}
				}
				else
				{
					part = 1;

					// zero length means there is no record this time
					pendingRecordSize = static_cast<std::size_t>(data[offset]) * 16;
					recordSize        = 0;
					if (!pendingRecordSize)
					{
						bytesUntilNextMetadata = interval;
					}
				}
			}

			return audioSize;
		}

		void MetadataProcessor::reset()
		{
			interval               = 0;
			bytesUntilNextMetadata = 0;
			pendingRecordSize      = 0;
			recordSize             = 0;
		}

		void MetadataProcessor::start(std::size_t i)
		{
			reset();

			interval               = i;
			bytesUntilNextMetadata = i;

			LOG(DEBUG) << LABELS{"icy"} << "Metadata processing was started (interval=" << interval << ")";
		}

		void MetadataProcessor::onRecord(std::size_t audioOffset)
		{
			auto record{std::string{reinterpret_cast<const char*>(recordBuffer.getData()), recordSize}};

			recordSize             = 0;
			bytesUntilNextMetadata = interval;

			auto metadata{parserPtr->parse(record)};
			if (metadata.has_value())
			{
				metadataCallback(std::move(metadata.value()), audioOffset);
			}
			else
			{
				LOG(WARNING) << LABELS{"icy"} << "Skipping metadata record that could not be parsed (size=" << record.size() << ")";
			}
		}
	}
}
