/**
 * @file FileEntry.cpp
 * @brief Implementation of the FileEntry read method.
 */

#include "dosrestore/records/FileEntry.hpp"
#include "dosrestore/RecordTraits.hpp"
#include "DataBuffer.hpp" // Internal buffer header

namespace dosrestore
{
    size_t FileEntry::read(const DataBuffer& buffer)
    {
        constexpr auto kind = record_name<FileEntry>;
        checkLength(buffer, kLength, kind);

        const uint8_t flag = buffer.readByte(0x0D);
        if (flag != kFlagSplit && flag != kFlagComplete)
        {
            malformed(kind, "invalid completeness flag " + std::to_string(flag));
        }

        name              = buffer.readString(0x01, kNameWidth);
        checkText(kind, "name", name);
        is_final_fragment = flag == kFlagComplete;
        final_size        = buffer.readLong(0x0E);
        fragment_sequence = buffer.readWord(0x12);
        payload_offset    = buffer.readLong(0x14);
        payload_length    = buffer.readLong(0x18);
        attributes        = buffer.readByte(0x1C);
        reserved          = buffer.readByte(0x1D);
        timestamp         = DosTimestamp::fromBytes(buffer.view(0x1E, 4));

        return kLength;
    }

} // namespace dosrestore
