/**
 * @file Reconstruction.hpp
 * @brief Validation pass over the planned actions.
 *
 * Before anything is written, the whole action list is replayed
 * against a per-destination progress record. Each action either
 * advances the record or is rejected, so every ordering and size
 * problem surfaces before the first byte reaches the disk.
 */

#pragma once

#include "PlannedAction.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace dosrestore
{
    /**
     * @struct DestinationProgress
     * @brief How far the reconstruction of one destination has got.
     */
    struct DestinationProgress
    {
        uint16_t last_fragment_sequence = 0;
        uint64_t bytes_written_so_far = 0;
        bool     is_complete = false;

        bool operator==(const DestinationProgress&) const = default;
    };

    /// Progress keyed by destination path.
    using ProgressMap = std::map<std::string, DestinationProgress>;

    /// Answers whether a destination already exists on disk.
    using ExistenceProbe = std::function<bool(const std::string& destination)>;

    /**
     * @struct ValidationReport
     * @brief Outcome of a successful validation pass.
     */
    struct ValidationReport
    {
        ProgressMap progress;
        std::vector<std::string> incomplete_files; ///< FullSet only; non-fatal
    };

    /**
     * @brief Progress record for the first action seen for a destination.
     *
     * @param action The action.
     * @param mode FullSet requires fragment 1.
     * @param destinationExists Whether the destination is already on disk.
     * @param overwrite Whether an existing destination may be replaced.
     * @throws RestoreError OutOfOrderFirstFragment, ClobberRefused or
     * MissingPriorFragment.
     */
    DestinationProgress startProgress(const PlannedAction& action, RestoreMode mode,
                                      bool destinationExists, bool overwrite);

    /**
     * @brief Progress record after one more action for a known destination.
     * @throws RestoreError AppendToCompletedFile, FragmentOutOfOrder or
     * SizeMismatch.
     */
    DestinationProgress advanceProgress(const DestinationProgress& progress,
                                        const PlannedAction& action);

    /**
     * @class ReconstructionValidator
     * @brief Folds the progress transitions over a whole action list.
     */
    class ReconstructionValidator
    {
    public:
        /**
         * @param mode Rule set to apply.
         * @param overwrite Allow fragment 1 to replace an existing file.
         * @param exists Existence probe, consulted once per destination.
         */
        ReconstructionValidator(RestoreMode mode, bool overwrite, ExistenceProbe exists);

        /**
         * @brief Validates every action in order.
         * @return The final progress map and the files left incomplete.
         * @throws RestoreError on the first invalid action.
         */
        ValidationReport validate(const std::vector<PlannedAction>& actions) const;

    private:
        RestoreMode m_mode;
        bool m_overwrite;
        ExistenceProbe m_exists;
    };

} // namespace dosrestore
