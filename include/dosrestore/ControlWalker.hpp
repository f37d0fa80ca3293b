/**
 * @file ControlWalker.hpp
 * @brief Turns the blocks of one control file into PlannedActions.
 *
 * The walk is a small state machine. After the header, every block
 * is either a directory marker, which opens a new directory context,
 * or a file entry, which is checked against that context and the
 * size of the paired BACKUP file and becomes one PlannedAction.
 */

#pragma once

#include "ControlFile.hpp"
#include "PlannedAction.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dosrestore
{
    /**
     * @struct WalkState
     * @brief Directory context carried from one block to the next.
     */
    struct WalkState
    {
        std::optional<DirectoryMarker> directory; ///< Active marker, if any
        uint32_t entries_seen = 0;                ///< File entries since that marker
    };

    /**
     * @brief Joins a DOS directory path and file name into a relative
     * destination path.
     *
     * Backslashes become '/', and empty, "." and leading separator
     * components are dropped. The root directory yields just the name.
     *
     * @throws RestoreError MalformedRecord if a ".." component appears.
     */
    std::string makeDestination(const std::string& directory, const std::string& name);

    /**
     * @class ControlWalker
     * @brief Walks one control file against its paired payload file.
     */
    class ControlWalker
    {
    public:
        /**
         * @param volume The volume being walked; payload_size bounds
         * every chunk.
         */
        explicit ControlWalker(VolumeInfo volume);

        // --- State Transitions ---

        /**
         * @brief Handles a directory marker.
         * @throws RestoreError IncompleteDirectory if the previous marker
         * still expected entries.
         */
        WalkState onDirectory(const WalkState& state, const DirectoryMarker& marker) const;

        /**
         * @brief Handles a file entry, appending its PlannedAction.
         * @throws RestoreError FileEntryBeforeDirectory, DirectoryOverflow,
         * ChunkBeyondPayload or SizeMismatch.
         */
        WalkState onFileEntry(const WalkState& state, const FileEntry& entry,
                              std::vector<PlannedAction>& actions) const;

        /**
         * @brief Dispatches any block to the matching transition.
         * @throws RestoreError UnknownBlockTag for a header after the first block.
         */
        WalkState step(const WalkState& state, const ControlBlock& block,
                       std::vector<PlannedAction>& actions) const;

        /**
         * @brief Checks the final state at the end of the stream.
         * @throws RestoreError IncompleteDirectory.
         */
        void finish(const WalkState& state) const;

        // --- Driver ---

        /**
         * @brief Walks every remaining block of an opened control file.
         * @return The actions of this volume, in stream order.
         */
        std::vector<PlannedAction> walk(ControlFile& file) const;

    private:
        void checkDirectoryComplete(const WalkState& state) const;

        VolumeInfo m_volume;
    };

} // namespace dosrestore
