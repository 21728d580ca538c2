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

#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint8_t
#include <functional>
#include <memory>

#include "radio/icy/Metadata.hpp"
#include "radio/icy/MetadataParser.hpp"
#include "radio/util/buffer/HeapBuffer.hpp"


namespace radio
{
	namespace icy
	{
		/**
		 * Separates audio bytes from metadata records interleaved every 'interval' audio bytes.
		 *
		 * Wire format after each interval: one length byte N followed by N*16 bytes of record text.
		 * Parsing state survives across calls, so a chunk may end anywhere, including inside
		 * the length byte or a record.
		 */
		class MetadataProcessor
		{
			public:
				// metadata and the amount of audio bytes produced by the current call before the record
				using MetadataCallbackType = std::function<void(Metadata, std::size_t)>;

				static constexpr std::size_t maxRecordSize{255 * 16};

				explicit MetadataProcessor(std::unique_ptr<MetadataParserBase> p = std::make_unique<MetadataParser>());

				// using Rule Of Zero
			   ~MetadataProcessor() = default;
				MetadataProcessor(const MetadataProcessor&) = delete;             // non-copyable
				MetadataProcessor& operator=(const MetadataProcessor&) = delete;  // non-assignable
				MetadataProcessor(MetadataProcessor&& rhs) = default;
				MetadataProcessor& operator=(MetadataProcessor&& rhs) = default;

				inline auto getBytesUntilNextMetadata() const
				{
					return bytesUntilNextMetadata;
				}

				inline auto getInterval() const
				{
					return interval;
				}

				inline auto getPendingRecordSize() const
				{
					return pendingRecordSize;
				}

				inline bool isEnabled() const
				{
					return interval > 0;
				}

				// moves audio bytes to the front of the buffer and returns their amount
				std::size_t processInPlace(std::uint8_t* data, std::size_t size);

				// disables interleaving; data passes through unchanged
				void reset();

				inline void setMetadataCallback(MetadataCallbackType c)
				{
					metadataCallback = std::move(c);
				}

				// enables interleaving and restarts counting from the beginning of a body
				void start(std::size_t i);

			protected:
				void onRecord(std::size_t audioOffset);

			private:
				std::unique_ptr<MetadataParserBase>    parserPtr;
				MetadataCallbackType                   metadataCallback{[](auto, auto) {}};
				std::size_t                            interval{0};
				std::size_t                            bytesUntilNextMetadata{0};
				std::size_t                            pendingRecordSize{0};
				util::buffer::HeapBuffer<std::uint8_t> recordBuffer{maxRecordSize};
				std::size_t                            recordSize{0};
		};
	}
}
