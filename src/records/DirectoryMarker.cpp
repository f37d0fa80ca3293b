/**
 * @file DirectoryMarker.cpp
 * @brief Implementation of the DirectoryMarker read method.
 */

#include "dosrestore/records/DirectoryMarker.hpp"
#include "dosrestore/RecordTraits.hpp"
#include "DataBuffer.hpp" // Internal buffer header
#include <algorithm>

namespace dosrestore
{
    size_t DirectoryMarker::read(const DataBuffer& buffer)
    {
        constexpr auto kind = record_name<DirectoryMarker>;
        checkLength(buffer, kLength, kind);

        path                 = buffer.readString(0x01, kPathWidth);
        checkText(kind, "path", path);
        declared_entry_count = buffer.readWord(0x40);

        // Seen values include FFFFFFFF and small positive numbers with no
        // obvious meaning, so it is kept but not checked.
        auto raw = buffer.view(0x42, reserved.size());
        std::copy(raw.begin(), raw.end(), reserved.begin());

        return kLength;
    }

} // namespace dosrestore
