/**
 * @file Restore.hpp
 * @brief Top-level restore pipeline.
 *
 * The flow is:
 *   1. find the control files (all CONTROL.NNN, or one explicit file)
 *   2. walk every control file, building the list of chunk copies
 *   3. drop the files the wildcard does not select
 *   4. in list mode, print one line per file and stop
 *   5. validate the whole list
 *   6. copy the chunks
 */

#pragma once

#include "Materializer.hpp"
#include "PlannedAction.hpp"
#include "Reconstruction.hpp"
#include "VolumeSet.hpp"
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace dosrestore
{
    /**
     * @struct RestoreOptions
     * @brief Run configuration, normally filled from the command line.
     */
    struct RestoreOptions
    {
        bool list_only = false;          ///< Only list the files in the set
        bool overwrite = false;          ///< Allow replacing existing files
        bool restore_timestamps = false; ///< Set mtimes from the control entries
        bool debug = false;              ///< Trace every record
        std::optional<std::string> pattern;                ///< Wildcard on file names
        std::optional<std::filesystem::path> control_file; ///< Explicit file: Incremental mode
        std::filesystem::path source_dir = ".";            ///< Where CONTROL.NNN are searched
        std::filesystem::path output_dir = ".";            ///< Root of the restored tree
    };

    /**
     * @struct RestoreSummary
     * @brief What a run did.
     */
    struct RestoreSummary
    {
        RestoreMode mode = RestoreMode::FullSet;
        size_t volumes = 0;
        size_t actions = 0;              ///< After filtering
        bool listed_only = false;
        MaterializeStats written;
        std::vector<std::string> warnings;
    };

    /**
     * @brief Formats a byte count with thousands separators, right
     * aligned in 12 columns.
     */
    std::string formatFileSize(uint64_t size);

    /**
     * @brief One listing line per destination, from its first action:
     * "<date> <size> <path>".
     */
    std::vector<std::string> listingLines(const std::vector<PlannedAction>& actions);

    /**
     * @class Restorer
     * @brief Runs the pipeline for one set of options.
     */
    class Restorer
    {
    public:
        explicit Restorer(RestoreOptions options);

        /**
         * @brief The volumes this run covers, and hence its mode.
         */
        VolumeSet volumeSet() const;

        /**
         * @brief Steps 1-3: scan the volumes and apply the wildcard.
         * @throws RestoreError if a control file is missing or malformed.
         */
        ScanResult plan() const;

        /**
         * @brief Runs the whole pipeline.
         * @param listing Where list mode writes its lines.
         * @throws RestoreError on any fatal condition.
         */
        RestoreSummary run(std::ostream& listing) const;

        const RestoreOptions& getOptions() const { return m_options; }

    private:
        RestoreOptions m_options;
    };

} // namespace dosrestore
