/**
 * @file Materializer.hpp
 * @brief Executes validated PlannedActions against the file system.
 */

#pragma once

#include "PlannedAction.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

namespace dosrestore
{
    /**
     * @struct MaterializeStats
     * @brief Totals for one execution pass.
     */
    struct MaterializeStats
    {
        size_t   chunks_copied = 0;
        size_t   files_touched = 0;
        uint64_t bytes_written = 0;
    };

    /**
     * @class Materializer
     * @brief Copies payload byte ranges into destination files.
     *
     * Destinations are resolved under the output root. Fragment 1
     * truncates and creates the destination, later fragments append.
     * Nothing is rolled back if a write fails part way.
     */
    class Materializer
    {
    public:
        /**
         * @param outputRoot Directory the relative destinations live under.
         * @param restoreTimestamps Set each file's mtime from its entry.
         */
        Materializer(std::filesystem::path outputRoot, bool restoreTimestamps);

        /**
         * @brief Runs every action in order.
         *
         * With timestamp restoration on, a file's modification time is
         * set after the last action for it in the list.
         *
         * @throws RestoreError IoFailure on the first I/O error.
         */
        MaterializeStats materialize(const std::vector<PlannedAction>& actions) const;

        /**
         * @brief Copies one chunk.
         * @throws RestoreError IoFailure.
         */
        void copyChunk(const PlannedAction& action) const;

        /**
         * @brief Sets the modification time of the action's destination.
         * @throws RestoreError IoFailure.
         */
        void applyTimestamp(const PlannedAction& action) const;

        /**
         * @brief Absolute location of a relative destination.
         */
        std::filesystem::path resolve(const std::string& destination) const;

    private:
        std::filesystem::path m_outputRoot;
        bool m_restoreTimestamps;
    };

} // namespace dosrestore
