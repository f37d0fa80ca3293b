/**
 * @file main.cpp
 * @brief dosrestore command line: list or extract a set of DOS BACKUP files.
 *
 * Works on the CONTROL.NNN and BACKUP.NNN files copied off the backup
 * floppies into one directory. Without a control file argument every
 * CONTROL.NNN there is processed as one backup set; naming a single
 * control file processes just that volume, appending to files that an
 * earlier run started.
 */

#include "dosrestore/Errors.hpp"
#include "dosrestore/Restore.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <getopt.h>
#include <iostream>

namespace
{
    void usage(const char* prog)
    {
        std::cerr <<
            "Usage: " << prog << " [options] [CONTROL.NNN]\n"
            "\n"
            "Restore the files of a DOS BACKUP disk set.\n"
            "\n"
            "  -l, --list            only list the files contained in the backup\n"
            "  -c, --clobber         allow restored files to overwrite existing files\n"
            "  -t, --timestamp       preserve the timestamp on the restored files\n"
            "  -w, --wildcard PAT    a file name or pattern of which files to restore\n"
            "  -s, --source DIR      directory holding CONTROL.NNN/BACKUP.NNN (default .)\n"
            "  -o, --output DIR      directory to restore into (default .)\n"
            "  -d, --debug           print detailed status as the files are processed\n"
            "  -h, --help            show this help\n"
            "\n"
            "CONTROL.NNN  process only this control file (incremental restore);\n"
            "             otherwise all CONTROL.NNN files in the source directory\n";
    }
}

int main(int argc, char* argv[])
{
    static const struct option longOptions[] = {
        {"list",      no_argument,       nullptr, 'l'},
        {"clobber",   no_argument,       nullptr, 'c'},
        {"timestamp", no_argument,       nullptr, 't'},
        {"wildcard",  required_argument, nullptr, 'w'},
        {"source",    required_argument, nullptr, 's'},
        {"output",    required_argument, nullptr, 'o'},
        {"debug",     no_argument,       nullptr, 'd'},
        {"help",      no_argument,       nullptr, 'h'},
        {nullptr,     0,                 nullptr, 0}
    };

    dosrestore::RestoreOptions options;

    int opt;
    while ((opt = getopt_long(argc, argv, "lctw:s:o:dh", longOptions, nullptr)) != -1)
    {
        switch (opt)
        {
        case 'l': options.list_only = true; break;
        case 'c': options.overwrite = true; break;
        case 't': options.restore_timestamps = true; break;
        case 'w': options.pattern = optarg; break;
        case 's': options.source_dir = optarg; break;
        case 'o': options.output_dir = optarg; break;
        case 'd': options.debug = true; break;
        case 'h':
            usage(argv[0]);
            return 0;
        default:
            usage(argv[0]);
            return 2;
        }
    }

    if (argc - optind > 1)
    {
        spdlog::error("at most one control file may be given");
        usage(argv[0]);
        return 2;
    }
    if (optind < argc)
    {
        options.control_file = argv[optind];
    }

    spdlog::set_pattern("%v");
    spdlog::set_level(options.debug ? spdlog::level::debug : spdlog::level::info);

    try
    {
        dosrestore::Restorer restorer(options);
        restorer.run(std::cout);
    }
    catch (const dosrestore::RestoreError& e)
    {
        spdlog::error("Error: {}", e.what());
        if (e.code() == dosrestore::ErrorCode::ClobberRefused)
        {
            spdlog::error("Use command argument --clobber to override this");
        }
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    return 0;
}
