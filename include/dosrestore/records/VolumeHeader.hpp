/**
 * @file VolumeHeader.hpp
 * @brief Definition of the control file header record.
 *
 * Offset  Size       Contents
 * 0x0000    1 byte   0x8B, record length including this byte
 * 0x0001    8 bytes  Signature "BACKUP  "
 * 0x0009    1 byte   Volume (disk) sequence number, same as the extension
 * 0x000A  128 bytes  All zero
 * 0x008A    1 byte   0xFF on the last volume of the set, 0x00 otherwise
 */

#pragma once

#include "../Record.hpp"
#include <cstdint>
#include <string_view>

namespace dosrestore
{
    /**
     * @struct VolumeHeader
     * @brief First record of every CONTROL.NNN file.
     */
    struct VolumeHeader : public Record
    {
        static constexpr uint8_t kLength = 0x8B;
        static constexpr std::string_view kSignature = "BACKUP  ";
        static constexpr uint8_t kFinalSentinel = 0xFF;

        // --- Member Variables ---
        uint8_t sequence_number = 0; ///< 1-based position in the backup set
        bool    is_final_volume = false; ///< Sentinel byte was 0xFF

        using Record::Record;

        /**
         * @brief Decodes and validates a 139-byte header block.
         * @return The number of bytes read (139).
         */
        size_t read(const DataBuffer& buffer) override;
    };

} // namespace dosrestore
