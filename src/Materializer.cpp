/**
 * @file Materializer.cpp
 * @brief Implementation of the chunk materializer.
 */

#include "dosrestore/Materializer.hpp"
#include "dosrestore/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <map>
#include <system_error>
#include <utility>
#include <vector>
#include <utime.h>

namespace fs = std::filesystem;

namespace dosrestore
{
    namespace
    {
        std::string lastError()
        {
            return errno != 0 ? std::strerror(errno) : "unknown error";
        }
    }

    Materializer::Materializer(fs::path outputRoot, bool restoreTimestamps)
        : m_outputRoot(std::move(outputRoot)), m_restoreTimestamps(restoreTimestamps)
    {
    }

    fs::path Materializer::resolve(const std::string& destination) const
    {
        return m_outputRoot / fs::path(destination);
    }

    void Materializer::copyChunk(const PlannedAction& action) const
    {
        // Read the chunk from the BACKUP.NNN file
        std::vector<char> chunk(action.payload_length);
        {
            std::ifstream in(action.payload_path, std::ios::binary);
            if (!in.is_open())
            {
                throw RestoreError(ErrorCode::IoFailure,
                                   "cannot open '" + action.payload_path + "': " + lastError());
            }
            in.seekg(action.payload_offset);
            in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            if (in.gcount() != static_cast<std::streamsize>(chunk.size()))
            {
                throw RestoreError(ErrorCode::IoFailure,
                                   "short read of " + std::to_string(action.payload_length) +
                                   " bytes at offset " + std::to_string(action.payload_offset) +
                                   " of '" + action.payload_path + "'");
            }
        }

        // Create subdirectories, if necessary
        const fs::path target = resolve(action.destination);
        if (target.has_parent_path())
        {
            std::error_code ec;
            fs::create_directories(target.parent_path(), ec);
            if (ec)
            {
                throw RestoreError(ErrorCode::IoFailure,
                                   "cannot create directory '" + target.parent_path().string() +
                                   "': " + ec.message());
            }
        }

        const auto mode = std::ios::binary |
            (action.fragment_sequence == 1 ? std::ios::trunc : std::ios::app);
        std::ofstream out(target, std::ios::out | mode);
        if (!out.is_open())
        {
            throw RestoreError(ErrorCode::IoFailure,
                               "cannot open '" + target.string() + "' for writing: " + lastError());
        }
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        out.close();
        if (out.fail())
        {
            throw RestoreError(ErrorCode::IoFailure,
                               "write to '" + target.string() + "' failed: " + lastError());
        }
    }

    void Materializer::applyTimestamp(const PlannedAction& action) const
    {
        const fs::path target = resolve(action.destination);
        const std::time_t when = action.timestamp.toTimeT();
        if (when == static_cast<std::time_t>(-1))
        {
            spdlog::warn("Warning: timestamp {} of {} cannot be represented, left unchanged",
                         action.timestamp.toString(), action.destination);
            return;
        }

        struct utimbuf times;
        times.actime = when;
        times.modtime = when;
        if (::utime(target.c_str(), &times) != 0)
        {
            throw RestoreError(ErrorCode::IoFailure,
                               "cannot set time of '" + target.string() + "': " + lastError());
        }
    }

    MaterializeStats Materializer::materialize(const std::vector<PlannedAction>& actions) const
    {
        // Index of the last action for each destination
        std::map<std::string, size_t> lastAction;
        for (size_t i = 0; i < actions.size(); ++i)
        {
            lastAction[actions[i].destination] = i;
        }

        MaterializeStats stats;
        for (size_t i = 0; i < actions.size(); ++i)
        {
            const PlannedAction& action = actions[i];
            copyChunk(action);

            stats.chunks_copied++;
            stats.bytes_written += action.payload_length;

            if (lastAction[action.destination] == i)
            {
                if (m_restoreTimestamps)
                {
                    applyTimestamp(action);
                }
                stats.files_touched++;
                spdlog::info("Restored {}", action.destination);
            }
        }
        return stats;
    }

} // namespace dosrestore
