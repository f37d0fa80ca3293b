/**
 * @file Errors.hpp
 * @brief Error conditions raised while reading and restoring a backup set.
 *
 * Every fatal condition is reported as a RestoreError carrying an
 * ErrorCode, so callers (and tests) can tell the failures apart without
 * parsing the message text. The message itself names the file, offset
 * and expected/actual values involved.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dosrestore
{
    /**
     * @enum ErrorCode
     * @brief Closed set of fatal conditions.
     */
    enum class ErrorCode
    {
        MalformedRecord,          ///< Wrong length, bad signature, padding, flag or truncation
        UnknownBlockTag,          ///< Length tag that matches no record kind
        IncompleteDirectory,      ///< Fewer file entries than the directory marker declared
        FileEntryBeforeDirectory, ///< File entry with no active directory marker
        DirectoryOverflow,        ///< More file entries than the directory marker declared
        ChunkBeyondPayload,       ///< Byte range extends past the end of the BACKUP file
        SizeMismatch,             ///< Reconstructed size differs from the recorded size
        VolumeSequenceError,      ///< Gap or repeat in the volume sequence numbers
        MissingControlFile,       ///< CONTROL.NNN not found
        MissingPayload,           ///< BACKUP.NNN not found
        OutOfOrderFirstFragment,  ///< First fragment seen for a file is not fragment 1
        ClobberRefused,           ///< Destination exists and overwriting was not allowed
        MissingPriorFragment,     ///< Continuation fragment with no existing destination
        AppendToCompletedFile,    ///< Fragment after the final fragment of a file
        FragmentOutOfOrder,       ///< Fragment sequence gap or repeat
        IoFailure                 ///< Host file system error
    };

    /**
     * @brief Stable identifier for an ErrorCode (e.g. "ClobberRefused").
     */
    std::string_view errorCodeName(ErrorCode code);

    /**
     * @class RestoreError
     * @brief Exception type for every fatal condition.
     */
    class RestoreError : public std::runtime_error
    {
    public:
        RestoreError(ErrorCode code, const std::string& message)
            : std::runtime_error(std::string(errorCodeName(code)) + ": " + message),
              m_code(code) {}

        ErrorCode code() const noexcept { return m_code; }

    private:
        ErrorCode m_code;
    };

} // namespace dosrestore
