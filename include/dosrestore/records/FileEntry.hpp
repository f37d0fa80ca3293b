/**
 * @file FileEntry.hpp
 * @brief Definition of the file entry record.
 *
 * Offset  Size       Contents
 * 0x0000    1 byte   0x22, record length including this byte
 * 0x0001   12 bytes  File name, NUL padded
 * 0x000D    1 byte   0x03 complete (last fragment), 0x02 split
 * 0x000E    4 bytes  Size of the whole original file
 * 0x0012    2 bytes  Fragment sequence, 1 = first or only
 * 0x0014    4 bytes  Offset of the fragment in BACKUP.NNN
 * 0x0018    4 bytes  Length of the fragment in BACKUP.NNN
 * 0x001C    1 byte   Attributes
 * 0x001D    1 byte   Unknown, not validated
 * 0x001E    4 bytes  Packed DOS time and date
 */

#pragma once

#include "../Record.hpp"
#include "../DosTimestamp.hpp"
#include <cstdint>
#include <string>

namespace dosrestore
{
    /**
     * @struct FileEntry
     * @brief One whole file, or one fragment of a file spanning volumes.
     */
    struct FileEntry : public Record
    {
        static constexpr uint8_t kLength = 0x22;
        static constexpr size_t kNameWidth = 12;
        static constexpr uint8_t kFlagSplit = 0x02;
        static constexpr uint8_t kFlagComplete = 0x03;

        /// Attribute bits, assumed to follow the FAT directory entry layout.
        enum Attribute : uint8_t
        {
            ReadOnly = 0x01,
            Hidden   = 0x02,
            System   = 0x04,
            Archive  = 0x20
        };

        // --- Member Variables ---
        std::string  name;                  ///< 8.3 file name
        bool         is_final_fragment = false; ///< Flag was 0x03
        uint32_t     final_size = 0;        ///< Size of the reconstructed file
        uint16_t     fragment_sequence = 0; ///< 1, 2, 3... across volumes
        uint32_t     payload_offset = 0;    ///< Start of the bytes in BACKUP.NNN
        uint32_t     payload_length = 0;    ///< Number of bytes in BACKUP.NNN
        uint8_t      attributes = 0;        ///< Best-effort attribute bits
        uint8_t      reserved = 0;          ///< Opaque byte at 0x1D
        DosTimestamp timestamp;             ///< Last modification time

        using Record::Record;

        /**
         * @brief Decodes a 34-byte file entry block.
         * @return The number of bytes read (34).
         */
        size_t read(const DataBuffer& buffer) override;

        bool hasAttribute(Attribute a) const { return (attributes & a) != 0; }
    };

} // namespace dosrestore
