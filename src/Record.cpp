/**
 * @file Record.cpp
 * @brief Shared validation helpers for the record decoders.
 */

#include "dosrestore/Record.hpp"
#include "dosrestore/Errors.hpp"
#include "DataBuffer.hpp"

namespace dosrestore
{
    void Record::checkLength(const DataBuffer& buffer, uint8_t expected, std::string_view kind) const
    {
        if (buffer.size() == 0)
        {
            malformed(kind, "empty block");
        }
        const uint8_t declared = buffer.readByte(0);
        if (declared != buffer.size())
        {
            malformed(kind, "length byte " + std::to_string(declared) +
                            " does not match block length " + std::to_string(buffer.size()));
        }
        if (declared != expected)
        {
            malformed(kind, "wrong length " + std::to_string(declared) +
                            ", expected " + std::to_string(expected));
        }
    }

    void Record::checkText(std::string_view kind, std::string_view field,
                           const std::string& text) const
    {
        for (size_t i = 0; i < text.size(); ++i)
        {
            const auto c = static_cast<unsigned char>(text[i]);
            if (c == 0x00 || c > 0x7F)
            {
                malformed(kind, std::string(field) + " has invalid byte " + std::to_string(c) +
                                " at position " + std::to_string(i));
            }
        }
    }

    void Record::malformed(std::string_view kind, const std::string& what) const
    {
        throw RestoreError(ErrorCode::MalformedRecord,
                           std::string(kind) + " at offset " + std::to_string(m_offset) + ": " + what);
    }

} // namespace dosrestore
