/**
 * @file VolumeSet.cpp
 * @brief Implementation of the multi-volume sequencer.
 */

#include "dosrestore/VolumeSet.hpp"
#include "dosrestore/ControlFile.hpp"
#include "dosrestore/ControlWalker.hpp"
#include "dosrestore/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <optional>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace dosrestore
{
    namespace
    {
        /**
         * @brief Volume number of a "CONTROL.NNN" file name, if it is one.
         */
        std::optional<unsigned> controlNumber(const std::string& filename)
        {
            static const std::string prefix = "CONTROL.";
            if (filename.size() != prefix.size() + 3) return std::nullopt;
            if (filename.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

            unsigned n = 0;
            for (size_t i = prefix.size(); i < filename.size(); ++i)
            {
                const unsigned char c = static_cast<unsigned char>(filename[i]);
                if (!std::isdigit(c)) return std::nullopt;
                n = n * 10 + (c - '0');
            }
            return n;
        }

        std::string threeDigits(unsigned n)
        {
            std::string s = std::to_string(n);
            while (s.size() < 3) s.insert(s.begin(), '0');
            return s;
        }
    }

    std::vector<fs::path> discoverControlFiles(const fs::path& dir)
    {
        std::vector<std::pair<unsigned, fs::path>> found;

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec)
        {
            throw RestoreError(ErrorCode::MissingControlFile,
                               "cannot read directory '" + dir.string() + "': " + ec.message());
        }

        for (const auto& entry : it)
        {
            if (!entry.is_regular_file(ec)) continue;
            if (auto n = controlNumber(entry.path().filename().string()))
            {
                found.emplace_back(*n, entry.path());
            }
        }

        std::sort(found.begin(), found.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        std::vector<fs::path> paths;
        paths.reserve(found.size());
        for (auto& entry : found)
        {
            paths.push_back(std::move(entry.second));
        }
        return paths;
    }

    fs::path payloadPathFor(const fs::path& controlPath, unsigned sequenceNumber)
    {
        return controlPath.parent_path() / ("BACKUP." + threeDigits(sequenceNumber));
    }

    // --- VolumeSet ---

    VolumeSet::VolumeSet(RestoreMode mode, std::vector<fs::path> controlFiles)
        : m_mode(mode), m_controlFiles(std::move(controlFiles))
    {
    }

    VolumeSet VolumeSet::discover(const fs::path& dir)
    {
        auto files = discoverControlFiles(dir);
        if (files.empty())
        {
            throw RestoreError(ErrorCode::MissingControlFile,
                               "no CONTROL.NNN files found in '" + dir.string() + "'");
        }
        return VolumeSet(RestoreMode::FullSet, std::move(files));
    }

    VolumeSet VolumeSet::single(const fs::path& controlFile)
    {
        return VolumeSet(RestoreMode::Incremental, {controlFile});
    }

    ScanResult VolumeSet::scan() const
    {
        ScanResult result;
        result.mode = m_mode;
        std::optional<unsigned> previousSeq;

        for (const auto& controlPath : m_controlFiles)
        {
            spdlog::debug("Processing control file '{}'", controlPath.string());

            std::error_code ec;
            if (!fs::is_regular_file(controlPath, ec))
            {
                throw RestoreError(ErrorCode::MissingControlFile,
                                   "control file '" + controlPath.string() + "' not found");
            }

            ControlFile file(controlPath.string());
            const VolumeHeader& header = file.getHeader();

            if (m_mode == RestoreMode::FullSet && previousSeq &&
                header.sequence_number != *previousSeq + 1)
            {
                throw RestoreError(ErrorCode::VolumeSequenceError,
                                   "previous disk seq#=" + std::to_string(*previousSeq) +
                                   "; current disk seq#=" + std::to_string(header.sequence_number) +
                                   " in '" + controlPath.string() + "'");
            }
            previousSeq = header.sequence_number;

            const fs::path payloadPath = payloadPathFor(controlPath, header.sequence_number);
            if (!fs::is_regular_file(payloadPath, ec))
            {
                throw RestoreError(ErrorCode::MissingPayload,
                                   "backup file '" + payloadPath.string() + "' not found");
            }
            const auto payloadSize = fs::file_size(payloadPath, ec);
            if (ec)
            {
                throw RestoreError(ErrorCode::IoFailure,
                                   "cannot read size of '" + payloadPath.string() + "': " + ec.message());
            }

            VolumeInfo volume;
            volume.control_path    = controlPath.string();
            volume.payload_path    = payloadPath.string();
            volume.payload_size    = payloadSize;
            volume.sequence_number = header.sequence_number;
            volume.is_final_volume = header.is_final_volume;

            ControlWalker walker(volume);
            auto actions = walker.walk(file);

            spdlog::debug("Volume {} ('{}'): {} file entries", volume.sequence_number,
                          volume.control_path, actions.size());

            result.actions.insert(result.actions.end(),
                                  std::make_move_iterator(actions.begin()),
                                  std::make_move_iterator(actions.end()));
            result.volumes.push_back(std::move(volume));
        }

        if (m_mode == RestoreMode::FullSet && !result.volumes.empty())
        {
            for (size_t i = 0; i + 1 < result.volumes.size(); ++i)
            {
                if (result.volumes[i].is_final_volume)
                {
                    result.warnings.push_back(
                        "volume " + std::to_string(result.volumes[i].sequence_number) +
                        " is marked as the last of the set but more volumes follow");
                }
            }
            if (!result.volumes.back().is_final_volume)
            {
                result.warnings.push_back(
                    "volume " + std::to_string(result.volumes.back().sequence_number) +
                    " is not marked as the last of the set; later volumes may be missing");
            }
        }

        for (const auto& w : result.warnings)
        {
            spdlog::warn("Warning: {}", w);
        }

        return result;
    }

} // namespace dosrestore
