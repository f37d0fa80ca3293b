#pragma once
#include <string_view>
#include "records/VolumeHeader.hpp"
#include "records/DirectoryMarker.hpp"
#include "records/FileEntry.hpp"

namespace dosrestore
{
    template <typename T> inline constexpr std::string_view record_name = "unknown record";

    template<> inline constexpr std::string_view record_name<VolumeHeader>    = "volume header";
    template<> inline constexpr std::string_view record_name<DirectoryMarker> = "directory marker";
    template<> inline constexpr std::string_view record_name<FileEntry>       = "file entry";
}
