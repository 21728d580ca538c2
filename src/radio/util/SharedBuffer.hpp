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
#include <mutex>

#include "radio/util/buffer/Ring.hpp"


namespace radio
{
	namespace util
	{
		// the only structure shared between the work queue (producer) and the decoder (consumer)
		class SharedBuffer
		{
			public:
				explicit SharedBuffer(std::size_t capacity)
				: ring{capacity} {}

				// using Rule Of Zero
			   ~SharedBuffer() = default;
				SharedBuffer(const SharedBuffer&) = delete;             // non-copyable
				SharedBuffer& operator=(const SharedBuffer&) = delete;  // non-assignable
				SharedBuffer(SharedBuffer&&) = delete;                  // non-movable
				SharedBuffer& operator=(SharedBuffer&&) = delete;       // non-move-assignable

				// callback is invoked under the lock so counters it updates stay consistent with the content
				template <typename CallbackType>
				inline void clear(CallbackType callback)
				{
					std::lock_guard<std::mutex> lock{mutex};

					ring.clear();
					callback();
				}

				inline auto getCapacity() const
				{
					return ring.getCapacity();
				}

				inline auto getFreeSize() const
				{
					std::lock_guard<std::mutex> lock{mutex};

					return ring.getFreeSize();
				}

				inline auto getSize() const
				{
					std::lock_guard<std::mutex> lock{mutex};

					return ring.getSize();
				}

				template <typename CallbackType>
				inline std::size_t read(std::uint8_t* data, std::size_t size, CallbackType callback)
				{
					std::lock_guard<std::mutex> lock{mutex};

					auto result{ring.read(data, size)};
					callback(result, ring.getFreeSize());

					return result;
				}

				// runs callback under the lock that guards the content
				template <typename CallbackType>
				inline auto synchronize(CallbackType callback) const
				{
					std::lock_guard<std::mutex> lock{mutex};

					return callback();
				}

				inline std::size_t write(const std::uint8_t* data, std::size_t size)
				{
					std::lock_guard<std::mutex> lock{mutex};

					return ring.write(data, size);
				}

			private:
				mutable std::mutex         mutex;
				buffer::Ring<std::uint8_t> ring;
		};
	}
}
