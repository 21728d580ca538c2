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

#include "radio/icy/Metadata.hpp"
#include "radio/source/SourceBase.hpp"


namespace radio
{
	namespace source
	{
		/**
		 * Receives source events on the source's work queue.
		 *
		 * In pull mode onDataAvailable carries no bytes (data is nullptr) and only tells how many
		 * bytes were added to the read buffer. onEndOfFile and onError are terminal for the current
		 * connection; a new one is started with seek or open.
		 */
		class DelegateBase
		{
			public:
				DelegateBase() = default;

				virtual ~DelegateBase() = default;
				DelegateBase(const DelegateBase&) = delete;             // non-copyable
				DelegateBase& operator=(const DelegateBase&) = delete;  // non-assignable
				DelegateBase(DelegateBase&&) = delete;                  // non-movable
				DelegateBase& operator=(DelegateBase&&) = delete;       // non-move-assignable

				virtual void onDataAvailable(SourceBase& source, const std::uint8_t* data, std::size_t size) = 0;
				virtual void onEndOfFile(SourceBase& source) = 0;
				virtual void onError(SourceBase& source) = 0;
				virtual void onMetadata(SourceBase& source, const icy::Metadata& metadata) = 0;
		};
	}
}
