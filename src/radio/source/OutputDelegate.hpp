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

#include <atomic>
#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint8_t, std::uint64_t
#include <ostream>
#include <string>

#include "radio/icy/Metadata.hpp"
#include "radio/log/log.hpp"
#include "radio/source/DelegateBase.hpp"
#include "radio/source/SourceBase.hpp"


namespace radio
{
	namespace source
	{
		/**
		 * Writes audio to an output stream and logs metadata; callbacks run on the work queue.
		 *
		 * Seeking is deferred until the first audio arrives because only the first response tells
		 * whether the resource supports byte ranges. In pull mode the reader must not consume
		 * the buffer until isReadable() returns true.
		 */
		class OutputDelegate : public DelegateBase
		{
			public:
				OutputDelegate(std::ostream& ou, std::uint64_t so)
				: output{ou}
				, seekOffset{so}
				, seekResolved{so == 0} {}

				inline auto isFailed() const
				{
					return failed.load();
				}

				inline auto isFinished() const
				{
					return finished.load();
				}

				inline auto isReadable() const
				{
					return seekResolved.load();
				}

				virtual void onDataAvailable(SourceBase& source, const std::uint8_t* data, std::size_t size) override
				{
					if (!seekResolved)
					{
						source.seek(seekOffset);

						// buffered bytes belong to the resource start until the seek decision is made
						seekResolved = true;

						// data of the cancelled request is not a part of the output
						if (source.getPosition() == seekOffset)
						{
							return;
						}

						LOG(WARNING) << "Seek was not possible, writing from the start of the resource (offset=" << seekOffset << ")";
					}

					// in pull mode bytes are read by the main thread
					if (data)
					{
						output.write(reinterpret_cast<const char*>(data), size);
					}
				}

				virtual void onEndOfFile(SourceBase& source) override
				{
					LOG(INFO) << "End of stream (length=" << (source.getLength().has_value() ? std::to_string(source.getLength().value()) : std::string{"unknown"}) << ")";

					finished = true;
				}

				virtual void onError(SourceBase& source) override
				{
					LOG(ERROR) << "Stream could not be received (position=" << source.getPosition() << ")";

					failed   = true;
					finished = true;
				}

				virtual void onMetadata(SourceBase& source, const icy::Metadata& metadata) override
				{
					for (auto& [key, value] : metadata)
					{
						LOG(INFO) << LABELS{"icy"} << key << "='" << value << "'";
					}
				}

			private:
				std::ostream&     output;
				std::uint64_t     seekOffset;
				std::atomic<bool> seekResolved;
				std::atomic<bool> finished{false};
				std::atomic<bool> failed{false};
		};
	}
}
