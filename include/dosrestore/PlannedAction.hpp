/**
 * @file PlannedAction.hpp
 * @brief One byte-copy operation derived from a file entry record.
 */

#pragma once

#include "DosTimestamp.hpp"
#include <cstdint>
#include <string>

namespace dosrestore
{
    /**
     * @enum RestoreMode
     * @brief Which rule set the sequencer and validator apply.
     *
     * FullSet processes every CONTROL.NNN of a backup set and enforces
     * volume contiguity, first-fragment ordering and completeness.
     * Incremental processes one explicit control file and relaxes those
     * checks, since earlier fragments may come from an earlier run.
     */
    enum class RestoreMode
    {
        FullSet,
        Incremental
    };

    /**
     * @struct VolumeInfo
     * @brief Header-derived metadata for one volume of the set.
     */
    struct VolumeInfo
    {
        std::string control_path;
        std::string payload_path;
        uint64_t    payload_size = 0;
        uint8_t     sequence_number = 0;
        bool        is_final_volume = false;
    };

    /**
     * @struct PlannedAction
     * @brief Copy payload_length bytes at payload_offset of payload_path
     * into destination.
     *
     * Actions are created in stream order, one per file entry, and are
     * not modified afterwards.
     */
    struct PlannedAction
    {
        std::string  control_path;      ///< CONTROL.NNN the entry came from
        std::string  payload_path;      ///< BACKUP.NNN holding the bytes
        uint32_t     payload_offset = 0;
        uint32_t     payload_length = 0;
        uint16_t     fragment_sequence = 0;
        bool         is_final_fragment = false;
        uint32_t     final_size = 0;
        std::string  destination;       ///< Relative path, '/' separated
        DosTimestamp timestamp;
        uint8_t      attributes = 0;
    };

} // namespace dosrestore
