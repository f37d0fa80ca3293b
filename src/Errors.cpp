/**
 * @file Errors.cpp
 * @brief Names for the ErrorCode values.
 */

#include "dosrestore/Errors.hpp"

namespace dosrestore
{
    std::string_view errorCodeName(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::MalformedRecord:          return "MalformedRecord";
        case ErrorCode::UnknownBlockTag:          return "UnknownBlockTag";
        case ErrorCode::IncompleteDirectory:      return "IncompleteDirectory";
        case ErrorCode::FileEntryBeforeDirectory: return "FileEntryBeforeDirectory";
        case ErrorCode::DirectoryOverflow:        return "DirectoryOverflow";
        case ErrorCode::ChunkBeyondPayload:       return "ChunkBeyondPayload";
        case ErrorCode::SizeMismatch:             return "SizeMismatch";
        case ErrorCode::VolumeSequenceError:      return "VolumeSequenceError";
        case ErrorCode::MissingControlFile:       return "MissingControlFile";
        case ErrorCode::MissingPayload:           return "MissingPayload";
        case ErrorCode::OutOfOrderFirstFragment:  return "OutOfOrderFirstFragment";
        case ErrorCode::ClobberRefused:           return "ClobberRefused";
        case ErrorCode::MissingPriorFragment:     return "MissingPriorFragment";
        case ErrorCode::AppendToCompletedFile:    return "AppendToCompletedFile";
        case ErrorCode::FragmentOutOfOrder:       return "FragmentOutOfOrder";
        case ErrorCode::IoFailure:                return "IoFailure";
        }
        return "Unknown";
    }

} // namespace dosrestore
