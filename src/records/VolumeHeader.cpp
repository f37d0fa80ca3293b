/**
 * @file VolumeHeader.cpp
 * @brief Implementation of the VolumeHeader read method.
 */

#include "dosrestore/records/VolumeHeader.hpp"
#include "dosrestore/RecordTraits.hpp"
#include "DataBuffer.hpp" // Internal buffer header

namespace dosrestore
{
    size_t VolumeHeader::read(const DataBuffer& buffer)
    {
        constexpr auto kind = record_name<VolumeHeader>;
        checkLength(buffer, kLength, kind);

        std::string signature(kSignature.size(), '\0');
        for (size_t i = 0; i < kSignature.size(); ++i)
        {
            signature[i] = static_cast<char>(buffer.readByte(0x01 + i));
        }
        if (signature != kSignature)
        {
            malformed(kind, "bad signature '" + signature + "'");
        }

        for (size_t o = 0x0A; o < 0x8A; ++o)
        {
            if (buffer.readByte(o) != 0)
            {
                malformed(kind, "non-zero padding byte at block offset " + std::to_string(o));
            }
        }

        const uint8_t sentinel = buffer.readByte(0x8A);
        if (sentinel != 0x00 && sentinel != kFinalSentinel)
        {
            malformed(kind, "invalid last-volume sentinel " + std::to_string(sentinel));
        }

        sequence_number = buffer.readByte(0x09);
        is_final_volume = sentinel == kFinalSentinel;
        return kLength;
    }

} // namespace dosrestore
