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
#include <cstdint>  // std::uint64_t, std::uint8_t
#include <functional>
#include <string>

#include "radio/http/Header.hpp"


namespace radio
{
	namespace http
	{
		using RequestID = std::uint64_t;

		// events of one streaming request: at most one header, any data, then either complete or failure
		class Callbacks
		{
			using HeaderCallbackType   = std::function<void(RequestID, unsigned int, const Headers&)>;
			using DataCallbackType     = std::function<void(RequestID, std::uint8_t*, const std::size_t)>;
			using CompleteCallbackType = std::function<void(RequestID)>;
			using FailureCallbackType  = std::function<void(RequestID, const std::string&)>;

			public:
				Callbacks() = default;

				// using Rule Of Zero
			   ~Callbacks() = default;
				Callbacks(const Callbacks&) = default;
				Callbacks& operator=(const Callbacks&) = default;
				Callbacks(Callbacks&& rhs) = default;
				Callbacks& operator=(Callbacks&& rhs) = default;

				inline auto& getCompleteCallback()
				{
					return completeCallback;
				}

				inline auto& getDataCallback()
				{
					return dataCallback;
				}

				inline auto& getFailureCallback()
				{
					return failureCallback;
				}

				inline auto& getHeaderCallback()
				{
					return headerCallback;
				}

				inline auto& setCompleteCallback(CompleteCallbackType c)
				{
					if (c)
					{
						completeCallback = std::move(c);
					}
					else
					{
						completeCallback = [](auto) {};
					}
					return (*this);
				}

				inline auto& setDataCallback(DataCallbackType c)
				{
					if (c)
					{
						dataCallback = std::move(c);
					}
					else
					{
						dataCallback = [](auto, auto*, auto) {};
					}
					return (*this);
				}

				inline auto& setFailureCallback(FailureCallbackType c)
				{
					if (c)
					{
						failureCallback = std::move(c);
					}
					else
					{
						failureCallback = [](auto, const auto&) {};
					}
					return (*this);
				}

				inline auto& setHeaderCallback(HeaderCallbackType c)
				{
					if (c)
					{
						headerCallback = std::move(c);
					}
					else
					{
						headerCallback = [](auto, auto, const auto&) {};
					}
					return (*this);
				}

			private:
				HeaderCallbackType   headerCallback{[](auto, auto, const auto&) {}};
				DataCallbackType     dataCallback{[](auto, auto*, auto) {}};
				CompleteCallbackType completeCallback{[](auto) {}};
				FailureCallbackType  failureCallback{[](auto, const auto&) {}};
		};
	}
}
