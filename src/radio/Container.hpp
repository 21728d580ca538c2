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

#include <memory>
#include <string>

#include "radio/ContainerBase.hpp"
#include "radio/http/Header.hpp"
#include "radio/log/log.hpp"


namespace radio
{
	template<typename TransportType, typename SourceType>
	class Container : public ContainerBase
	{
		public:
			Container(std::unique_ptr<TransportType> tr, std::unique_ptr<SourceType> so, std::string ur, http::Headers he)
			: transportPtr{std::move(tr)}
			, sourcePtr{std::move(so)}
			, url{std::move(ur)}
			, headers{std::move(he)} {}

			// source must go before transport as it may still cancel requests
			virtual ~Container()
			{
				sourcePtr.reset();
				transportPtr.reset();
			}

			Container(const Container&) = delete;             // non-copyable
			Container& operator=(const Container&) = delete;  // non-assignable
			Container(Container&& rhs) = delete;              // non-movable
			Container& operator=(Container&& rhs) = delete;   // non-movable-assignable

			inline auto& getSource()
			{
				return *sourcePtr;
			}

			virtual void start() override
			{
				sourcePtr->open(url, headers);
			}

			virtual void stop() override
			{
				sourcePtr->close();
			}

		private:
			std::unique_ptr<TransportType> transportPtr;
			std::unique_ptr<SourceType>    sourcePtr;
			std::string                    url;
			http::Headers                  headers;
	};
}
