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
#include <memory>   // std::unique_ptr


namespace radio
{
namespace util
{
namespace buffer
{

template
<
    typename ElementType,
    typename PointerType = std::unique_ptr<ElementType[]>
>
class HeapBuffer
{
    public:
        using SizeType = std::size_t;

        inline explicit HeapBuffer(const SizeType& s)
        : data{new ElementType[s]}
        , size{s} {}

        // using Rule Of Zero
        ~HeapBuffer() = default;
        HeapBuffer(const HeapBuffer&) = delete;             // non-copyable
        HeapBuffer& operator=(const HeapBuffer&) = delete;  // non-assignable
        HeapBuffer(HeapBuffer&& rhs) = default;
        HeapBuffer& operator=(HeapBuffer&& rhs) = default;

        inline auto* getData() const
        {
            return data.get();
        }

        inline auto getSize() const
        {
            return size;
        }

    private:
        PointerType data;
        SizeType    size;
};

}
}
}
