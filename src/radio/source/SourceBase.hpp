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
#include <cstdint>  // std::uint8_t, std::uint64_t
#include <string>
#include <type_safe/optional.hpp>

#include "radio/http/ContentType.hpp"
#include "radio/http/Header.hpp"


namespace radio
{
	namespace source
	{
		namespace ts = type_safe;

		class SourceBase
		{
			public:
				SourceBase() = default;

				virtual ~SourceBase() = default;
				SourceBase(const SourceBase&) = delete;             // non-copyable
				SourceBase& operator=(const SourceBase&) = delete;  // non-assignable
				SourceBase(SourceBase&&) = delete;                  // non-movable
				SourceBase& operator=(SourceBase&&) = delete;       // non-move-assignable

				virtual void                         close() = 0;
				virtual http::ContentTypeSelection   getContentTypeHint() const = 0;
				virtual ts::optional<std::uint64_t>  getLength() const = 0;
				virtual std::uint64_t                getPosition() const = 0;
				virtual void                         open(const std::string& url, http::Headers headers, std::uint64_t seekOffset = 0) = 0;
				virtual std::size_t                  read(std::uint8_t* data, std::size_t size) = 0;
				virtual void                         seek(std::uint64_t offset) = 0;
		};
	}
}
