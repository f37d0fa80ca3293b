/**
 * @file Restore.cpp
 * @brief Implementation of the restore pipeline.
 */

#include "dosrestore/Restore.hpp"
#include "dosrestore/NameFilter.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <ostream>
#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace dosrestore
{

std::string formatFileSize(uint64_t size)
{
    std::string digits = std::to_string(size);
    std::string grouped;
    const size_t n = digits.size();
    for (size_t i = 0; i < n; ++i)
    {
        grouped += digits[i];
        const size_t left = n - i - 1;
        if (left > 0 && left % 3 == 0) grouped += ',';
    }
    return fmt::format("{:>12}", grouped);
}

std::vector<std::string> listingLines(const std::vector<PlannedAction>& actions)
{
    // A file may exist as multiple chunks; report just the first one
    std::vector<std::string> lines;
    std::set<std::string> listed;
    for (const auto& action : actions)
    {
        if (listed.insert(action.destination).second)
        {
            lines.push_back(fmt::format("{} {} {}", action.timestamp.toString(),
                                        formatFileSize(action.final_size),
                                        action.destination));
        }
    }
    return lines;
}

// --- Restorer ---

Restorer::Restorer(RestoreOptions options)
    : m_options(std::move(options))
{
}

VolumeSet Restorer::volumeSet() const
{
    if (m_options.control_file)
    {
        return VolumeSet::single(*m_options.control_file);
    }
    return VolumeSet::discover(m_options.source_dir);
}

ScanResult Restorer::plan() const
{
    const VolumeSet volumes = volumeSet();
    spdlog::debug("{} control file(s) to process", volumes.getControlFiles().size());

    ScanResult scan = volumes.scan();

    if (m_options.pattern)
    {
        const size_t before = scan.actions.size();
        scan.actions = filterActions(scan.actions, *m_options.pattern);
        spdlog::debug("Wildcard '{}' selected {} of {} chunks", *m_options.pattern,
                      scan.actions.size(), before);
    }
    return scan;
}

RestoreSummary Restorer::run(std::ostream& listing) const
{
    ScanResult scan = plan();

    RestoreSummary summary;
    summary.mode = scan.mode;
    summary.volumes = scan.volumes.size();
    summary.actions = scan.actions.size();
    summary.warnings = scan.warnings;

    if (m_options.list_only)
    {
        for (const auto& line : listingLines(scan.actions))
        {
            listing << line << '\n';
        }
        summary.listed_only = true;
        return summary;
    }

    Materializer materializer(m_options.output_dir, m_options.restore_timestamps);

    ReconstructionValidator validator(
        summary.mode, m_options.overwrite,
        [&materializer](const std::string& destination) {
            std::error_code ec;
            return fs::is_regular_file(materializer.resolve(destination), ec);
        });
    ValidationReport report = validator.validate(scan.actions);

    for (const auto& file : report.incomplete_files)
    {
        summary.warnings.push_back("not all chunks of file " + file + " were specified");
    }

    summary.written = materializer.materialize(scan.actions);
    spdlog::info("Restored {} files, {} bytes from {} volume(s)",
                 summary.written.files_touched, summary.written.bytes_written,
                 summary.volumes);
    return summary;
}

} // namespace dosrestore
