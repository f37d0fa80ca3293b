/**
 * @file VolumeSet.hpp
 * @brief Orders the volumes of a backup set and walks each of them.
 */

#pragma once

#include "PlannedAction.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace dosrestore
{
    /**
     * @struct ScanResult
     * @brief Everything the control files say, in volume then stream order.
     */
    struct ScanResult
    {
        RestoreMode                mode = RestoreMode::FullSet;
        std::vector<VolumeInfo>    volumes;
        std::vector<PlannedAction> actions;
        std::vector<std::string>   warnings;
    };

    /**
     * @brief Finds every CONTROL.NNN (three decimal digits) in a directory.
     * @return The paths, ordered by volume number.
     */
    std::vector<std::filesystem::path> discoverControlFiles(const std::filesystem::path& dir);

    /**
     * @brief Name of the payload paired with a control file: BACKUP.NNN in
     * the same directory, NNN being the decoded sequence number.
     */
    std::filesystem::path payloadPathFor(const std::filesystem::path& controlPath,
                                         unsigned sequenceNumber);

    /**
     * @class VolumeSet
     * @brief The ordered control files of one restore run.
     */
    class VolumeSet
    {
    public:
        /**
         * @brief All CONTROL.NNN files of a directory, in FullSet mode.
         * @throws RestoreError MissingControlFile if there are none.
         */
        static VolumeSet discover(const std::filesystem::path& dir);

        /**
         * @brief One explicit control file, in Incremental mode.
         */
        static VolumeSet single(const std::filesystem::path& controlFile);

        VolumeSet(RestoreMode mode, std::vector<std::filesystem::path> controlFiles);

        /**
         * @brief Walks every volume in order.
         *
         * In FullSet mode each header's sequence number must follow the
         * previous one. The paired BACKUP.NNN of every volume must exist.
         *
         * @throws RestoreError VolumeSequenceError, MissingPayload,
         * MissingControlFile, or anything the walker raises.
         */
        ScanResult scan() const;

        RestoreMode getMode() const { return m_mode; }
        const std::vector<std::filesystem::path>& getControlFiles() const { return m_controlFiles; }

    private:
        RestoreMode m_mode;
        std::vector<std::filesystem::path> m_controlFiles;
    };

} // namespace dosrestore
