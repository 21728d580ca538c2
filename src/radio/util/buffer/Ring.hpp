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

#include <algorithm>  // std::min
#include <cstring>    // std::memcpy
#include <utility>    // std::as_const

#include "radio/util/buffer/HeapBuffer.hpp"


namespace radio
{
namespace util
{
namespace buffer
{

// FIFO of trivially copyable elements over a fixed heap buffer; writes never overwrite unread elements
template
<
    typename ElementType,
    template <typename, typename> class StorageType = HeapBuffer
>
class Ring
{
    public:
        using StorageSelection = StorageType<ElementType, std::unique_ptr<ElementType[]>>;
        using SizeType         = typename StorageSelection::SizeType;
        using IndexType        = SizeType;

        inline explicit Ring(const SizeType& c)
        : storage{c} {}

        inline const auto& operator[](const IndexType& i) const
        {
            return storage.getData()[normalizeIndex(head + i)];
        }

        inline auto& operator[](const IndexType& i)
        {
            return const_cast<ElementType&>(std::as_const(*this)[i]);
        }

        inline void clear()
        {
            head = 0;
            size = 0;
        }

        inline auto getCapacity() const
        {
            return storage.getSize();
        }

        inline auto getFreeSize() const
        {
            return getCapacity() - size;
        }

        inline auto getSize() const
        {
            return size;
        }

        inline auto isEmpty() const
        {
            return size == 0;
        }

        inline auto isFull() const
        {
            return size == getCapacity();
        }

        // returns amount of elements copied to the destination and removed from the ring
        inline SizeType read(ElementType* destination, const SizeType& count)
        {
            auto total{std::min(count, size)};

            for (SizeType copied{0}, part; copied < total; copied += part)
            {
                // copying up to the end of the storage at once
                part = std::min(total - copied, getCapacity() - head);
                std::memcpy(destination + copied, storage.getData() + head, part * sizeof(ElementType));

                head  = normalizeIndex(head + part);
                size -= part;
            }

            // rewinding helps subsequent writes to be done in one go
            if (isEmpty())
            {
                head = 0;
            }

            return total;
        }

        // returns amount of elements accepted; anything beyond the free space is left to the caller
        inline SizeType write(const ElementType* source, const SizeType& count)
        {
            auto total{std::min(count, getFreeSize())};

            for (SizeType copied{0}, part; copied < total; copied += part)
            {
                auto tail{normalizeIndex(head + size)};

                part = std::min(total - copied, getCapacity() - tail);
                std::memcpy(storage.getData() + tail, source + copied, part * sizeof(ElementType));

                size += part;
            }

            return total;
        }

    protected:
        inline auto normalizeIndex(const IndexType& i) const
        {
            return i < getCapacity() ? i : i - getCapacity();
        }

    private:
        StorageSelection storage;
        IndexType        head{0};
        SizeType         size{0};
};

}
}
}
