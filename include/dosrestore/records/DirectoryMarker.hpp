/**
 * @file DirectoryMarker.hpp
 * @brief Definition of the directory record.
 *
 * Offset  Size       Contents
 * 0x0000    1 byte   0x46, record length including this byte
 * 0x0001   63 bytes  Directory path, space/NUL padded; empty for the root
 * 0x0040    2 bytes  Number of file entries that follow in this directory
 * 0x0042    4 bytes  Unknown, not validated
 */

#pragma once

#include "../Record.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace dosrestore
{
    /**
     * @struct DirectoryMarker
     * @brief Sets the directory for the file entries that follow it.
     */
    struct DirectoryMarker : public Record
    {
        static constexpr uint8_t kLength = 0x46;
        static constexpr size_t kPathWidth = 63;

        // --- Member Variables ---
        std::string path;                  ///< Directory path, DOS separators
        uint16_t declared_entry_count = 0; ///< File entries expected before the next marker
        std::array<uint8_t, 4> reserved{}; ///< Opaque trailing field

        using Record::Record;

        /**
         * @brief Decodes a 70-byte directory block.
         * @return The number of bytes read (70).
         */
        size_t read(const DataBuffer& buffer) override;
    };

} // namespace dosrestore
