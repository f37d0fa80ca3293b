/**
 * @file ControlWalker.cpp
 * @brief Implementation of the ControlWalker state machine.
 */

#include "dosrestore/ControlWalker.hpp"
#include "dosrestore/Errors.hpp"
#include <spdlog/spdlog.h>
#include <type_traits>
#include <utility>
#include <variant>

namespace dosrestore
{

std::string makeDestination(const std::string& directory, const std::string& name)
{
    // A blank name would make the directory itself the destination
    if (name.find_first_not_of("\\/. ") == std::string::npos)
    {
        throw RestoreError(ErrorCode::MalformedRecord,
                           "file entry in '" + directory + "' has an empty name");
    }

    std::string joined = directory + '\\' + name;
    std::string result;
    std::string component;

    auto flush = [&]() {
        if (component.empty() || component == ".")
        {
            component.clear();
            return;
        }
        if (component == "..")
        {
            throw RestoreError(ErrorCode::MalformedRecord,
                               "path '" + directory + "\\" + name + "' leaves the restore root");
        }
        if (!result.empty()) result += '/';
        result += component;
        component.clear();
    };

    for (char c : joined)
    {
        if (c == '\\' || c == '/')
        {
            flush();
        }
        else
        {
            component += c;
        }
    }
    flush();
    return result;
}

ControlWalker::ControlWalker(VolumeInfo volume)
    : m_volume(std::move(volume))
{
}

// --- State Transitions ---

void ControlWalker::checkDirectoryComplete(const WalkState& state) const
{
    if (state.directory && state.entries_seen < state.directory->declared_entry_count)
    {
        throw RestoreError(ErrorCode::IncompleteDirectory,
                           "directory '" + state.directory->path + "' at offset " +
                           std::to_string(state.directory->getOffset()) + " of '" +
                           m_volume.control_path + "' expected " +
                           std::to_string(state.directory->declared_entry_count) +
                           " file entries, found " + std::to_string(state.entries_seen));
    }
}

WalkState ControlWalker::onDirectory(const WalkState& state, const DirectoryMarker& marker) const
{
    checkDirectoryComplete(state);

    spdlog::debug("    path: '{}'", marker.path);
    spdlog::debug("    files: {}", marker.declared_entry_count);

    WalkState next;
    next.directory = marker;
    next.entries_seen = 0;
    return next;
}

WalkState ControlWalker::onFileEntry(const WalkState& state, const FileEntry& entry,
                                     std::vector<PlannedAction>& actions) const
{
    if (!state.directory)
    {
        throw RestoreError(ErrorCode::FileEntryBeforeDirectory,
                           "file entry '" + entry.name + "' at offset " +
                           std::to_string(entry.getOffset()) + " of '" +
                           m_volume.control_path + "' precedes any directory marker");
    }

    const DirectoryMarker& dir = *state.directory;
    if (state.entries_seen + 1 > dir.declared_entry_count)
    {
        throw RestoreError(ErrorCode::DirectoryOverflow,
                           "directory '" + dir.path + "' declared " +
                           std::to_string(dir.declared_entry_count) +
                           " file entries, found more at offset " +
                           std::to_string(entry.getOffset()) + " of '" +
                           m_volume.control_path + "'");
    }

    spdlog::debug("    file='{}', seq={}, origsize={}, len={}, offset={}, attr={:02x}, date={}",
                  entry.name, entry.fragment_sequence, entry.final_size,
                  entry.payload_length, entry.payload_offset, entry.attributes,
                  entry.timestamp.toString());

    const uint64_t end = static_cast<uint64_t>(entry.payload_offset) + entry.payload_length;
    if (end > m_volume.payload_size)
    {
        throw RestoreError(ErrorCode::ChunkBeyondPayload,
                           "chunk (" + std::to_string(entry.payload_offset) + " + " +
                           std::to_string(entry.payload_length) + ") of '" + entry.name +
                           "' extends beyond '" + m_volume.payload_path + "' size " +
                           std::to_string(m_volume.payload_size));
    }

    if (entry.fragment_sequence == 1 && entry.is_final_fragment &&
        entry.payload_length != entry.final_size)
    {
        throw RestoreError(ErrorCode::SizeMismatch,
                           "chunk size " + std::to_string(entry.payload_length) + " of '" +
                           entry.name + "' doesn't match file size " +
                           std::to_string(entry.final_size));
    }

    PlannedAction action;
    action.control_path      = m_volume.control_path;
    action.payload_path      = m_volume.payload_path;
    action.payload_offset    = entry.payload_offset;
    action.payload_length    = entry.payload_length;
    action.fragment_sequence = entry.fragment_sequence;
    action.is_final_fragment = entry.is_final_fragment;
    action.final_size        = entry.final_size;
    action.destination       = makeDestination(dir.path, entry.name);
    action.timestamp         = entry.timestamp;
    action.attributes        = entry.attributes;
    actions.push_back(std::move(action));

    WalkState next = state;
    next.entries_seen++;
    return next;
}

WalkState ControlWalker::step(const WalkState& state, const ControlBlock& block,
                              std::vector<PlannedAction>& actions) const
{
    return std::visit([&](const auto& record) -> WalkState {
        using T = std::decay_t<decltype(record)>;
        if constexpr (std::is_same_v<T, DirectoryMarker>)
        {
            return onDirectory(state, record);
        }
        else if constexpr (std::is_same_v<T, FileEntry>)
        {
            return onFileEntry(state, record, actions);
        }
        else
        {
            throw RestoreError(ErrorCode::UnknownBlockTag,
                               "volume header tag at offset " +
                               std::to_string(record.getOffset()) + " of '" +
                               m_volume.control_path + "' after the first block");
        }
    }, block);
}

void ControlWalker::finish(const WalkState& state) const
{
    checkDirectoryComplete(state);
}

// --- Driver ---

std::vector<PlannedAction> ControlWalker::walk(ControlFile& file) const
{
    std::vector<PlannedAction> actions;
    WalkState state;
    ControlBlock block;

    while (file.nextBlock(block))
    {
        state = step(state, block, actions);
    }
    finish(state);

    return actions;
}

} // namespace dosrestore
