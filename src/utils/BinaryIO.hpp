/**
 * @file BinaryIO.hpp
 * @brief Central utility functions for binary I/O.
 *
 * This file provides a single source of truth for the low-level
 * little-endian conversions used by every control record decoder.
 * All multi-byte fields in a BACKUP control file are unsigned
 * and little-endian, regardless of the host.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace dosrestore
{
namespace utils
{
    /**
     * @brief Reads a 16-bit little-endian unsigned word from a byte buffer.
     * @param b A pointer to at least 2 bytes of data.
     * @return The platform-native uint16_t.
     */
    inline uint16_t readLeWord(const uint8_t* b)
    {
        return static_cast<uint16_t>(
            static_cast<uint16_t>(b[0]) |
            (static_cast<uint16_t>(b[1]) << 8)
        );
    }

    /**
     * @brief Reads a 32-bit little-endian unsigned long from a byte buffer.
     * @param b A pointer to at least 4 bytes of data.
     * @return The platform-native uint32_t.
     */
    inline uint32_t readLeLong(const uint8_t* b)
    {
        return static_cast<uint32_t>(b[0]) |
               (static_cast<uint32_t>(b[1]) << 8) |
               (static_cast<uint32_t>(b[2]) << 16) |
               (static_cast<uint32_t>(b[3]) << 24);
    }

    /**
     * @brief Decodes a fixed-width ASCII field.
     *
     * DOS BACKUP pads its text fields with spaces or NULs (or both),
     * so all trailing spaces and NULs are removed.
     *
     * @param b A pointer to the first byte of the field.
     * @param len Width of the field in bytes.
     * @return The trimmed text.
     */
    inline std::string readPaddedAscii(const uint8_t* b, size_t len)
    {
        while (len > 0 && (b[len - 1] == ' ' || b[len - 1] == '\0'))
        {
            --len;
        }
        return std::string(reinterpret_cast<const char*>(b), len);
    }

} // namespace utils
} // namespace dosrestore
