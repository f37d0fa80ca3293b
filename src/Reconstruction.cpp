/**
 * @file Reconstruction.cpp
 * @brief Implementation of the reconstruction state machine.
 */

#include "dosrestore/Reconstruction.hpp"
#include "dosrestore/Errors.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace dosrestore
{

DestinationProgress startProgress(const PlannedAction& action, RestoreMode mode,
                                  bool destinationExists, bool overwrite)
{
    if (mode == RestoreMode::FullSet && action.fragment_sequence != 1)
    {
        throw RestoreError(ErrorCode::OutOfOrderFirstFragment,
                           "first chunk of " + action.destination + " appears in " +
                           action.control_path + " with seq=" +
                           std::to_string(action.fragment_sequence));
    }
    if (action.fragment_sequence == 1 && destinationExists && !overwrite)
    {
        throw RestoreError(ErrorCode::ClobberRefused,
                           "can't clobber existing file " + action.destination);
    }
    if (action.fragment_sequence > 1 && !destinationExists)
    {
        throw RestoreError(ErrorCode::MissingPriorFragment,
                           "need to append chunk #" + std::to_string(action.fragment_sequence) +
                           " to non-existing file " + action.destination);
    }

    DestinationProgress progress;
    progress.last_fragment_sequence = action.fragment_sequence;
    progress.bytes_written_so_far = action.payload_length;
    progress.is_complete = action.is_final_fragment;
    return progress;
}

DestinationProgress advanceProgress(const DestinationProgress& progress,
                                    const PlannedAction& action)
{
    if (progress.is_complete)
    {
        throw RestoreError(ErrorCode::AppendToCompletedFile,
                           "control file " + action.control_path +
                           " attempted to add another chunk to complete file " +
                           action.destination);
    }
    if (action.fragment_sequence != progress.last_fragment_sequence + 1)
    {
        throw RestoreError(ErrorCode::FragmentOutOfOrder,
                           "chunk #" + std::to_string(progress.last_fragment_sequence) +
                           " of " + action.destination + " was followed by chunk #" +
                           std::to_string(action.fragment_sequence));
    }

    DestinationProgress next;
    next.last_fragment_sequence = action.fragment_sequence;
    next.bytes_written_so_far = progress.bytes_written_so_far + action.payload_length;
    next.is_complete = action.is_final_fragment;

    if (next.is_complete && next.bytes_written_so_far != action.final_size)
    {
        throw RestoreError(ErrorCode::SizeMismatch,
                           action.destination + " was expected to be " +
                           std::to_string(action.final_size) + " bytes long, but is actually " +
                           std::to_string(next.bytes_written_so_far));
    }
    return next;
}

// --- ReconstructionValidator ---

ReconstructionValidator::ReconstructionValidator(RestoreMode mode, bool overwrite,
                                                 ExistenceProbe exists)
    : m_mode(mode), m_overwrite(overwrite), m_exists(std::move(exists))
{
}

ValidationReport ReconstructionValidator::validate(const std::vector<PlannedAction>& actions) const
{
    ValidationReport report;
    ProgressMap& progress = report.progress;

    for (const auto& action : actions)
    {
        auto it = progress.find(action.destination);
        if (it == progress.end())
        {
            const bool exists = m_exists ? m_exists(action.destination) : false;
            progress.emplace(action.destination,
                             startProgress(action, m_mode, exists, m_overwrite));
        }
        else
        {
            it->second = advanceProgress(it->second, action);
        }
    }

    if (m_mode == RestoreMode::FullSet)
    {
        for (const auto& [destination, state] : progress)
        {
            if (!state.is_complete)
            {
                spdlog::warn("Warning: not all chunks of file {} were specified", destination);
                report.incomplete_files.push_back(destination);
            }
        }
    }

    return report;
}

} // namespace dosrestore
