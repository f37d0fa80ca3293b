/**
 * @file AllRecords.hpp
 * @brief Convenience header including every control record, plus the
 * closed variant used to hand decoded blocks around.
 */

#pragma once

#include "VolumeHeader.hpp"
#include "DirectoryMarker.hpp"
#include "FileEntry.hpp"
#include <variant>

namespace dosrestore
{
    /// One decoded block from a control file, selected by its length tag.
    using ControlBlock = std::variant<VolumeHeader, DirectoryMarker, FileEntry>;
}
