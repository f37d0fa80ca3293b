/**
 * @file DataBuffer.hpp
 * @brief Internal helper class to read fields out of one control block.
 *
 * This class wraps a std::span (C++20) over the bytes of a single block
 * and provides bounds-checked reads at offsets relative to the start of
 * that block. It is an internal implementation detail of the decoders.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <span>
#include "utils/BinaryIO.hpp"

namespace dosrestore
{
    class DataBuffer
    {
    public:
        /**
         * @brief Views one block of memory.
         * @param data A span of bytes, starting at the block's length tag.
         */
        explicit DataBuffer(std::span<const uint8_t> data) : m_span(data) {}

        size_t size() const { return m_span.size(); }

        /**
         * @brief Reads a single byte.
         * @param offset Byte offset to read from.
         */
        uint8_t readByte(size_t offset) const
        {
            checkBounds(offset, 1);
            return m_span[offset];
        }

        /**
         * @brief Reads a 2-byte little-endian word.
         * @param offset Byte offset to read from.
         * @return The uint16_t value.
         */
        uint16_t readWord(size_t offset) const
        {
            checkBounds(offset, sizeof(uint16_t));
            return utils::readLeWord(m_span.data() + offset);
        }

        /**
         * @brief Reads a 4-byte little-endian long.
         * @param offset Byte offset to read from.
         * @return The uint32_t value.
         */
        uint32_t readLong(size_t offset) const
        {
            checkBounds(offset, sizeof(uint32_t));
            return utils::readLeLong(m_span.data() + offset);
        }

        /**
         * @brief Reads a space/NUL padded ASCII field.
         * @param offset Byte offset of the field.
         * @param len Field width.
         */
        std::string readString(size_t offset, size_t len) const
        {
            checkBounds(offset, len);
            return utils::readPaddedAscii(m_span.data() + offset, len);
        }

        /**
         * @brief Returns a sub-view of the buffer.
         */
        std::span<const uint8_t> view(size_t offset, size_t len) const
        {
            checkBounds(offset, len);
            return m_span.subspan(offset, len);
        }

    private:
        /**
         * @brief Checks if a read is within the buffer bounds.
         * @throws std::out_of_range if the read is invalid.
         */
        void checkBounds(size_t offset, size_t readSize) const
        {
            if (offset + readSize > m_span.size())
            {
                throw std::out_of_range(
                    "Read offset " + std::to_string(offset) +
                    " with size " + std::to_string(readSize) +
                    " is out of bounds for buffer of size " +
                    std::to_string(m_span.size())
                );
            }
        }

        /// @brief A non-owning view of the current block.
        std::span<const uint8_t> m_span;
    };

} // namespace dosrestore
