/**
 * @file ControlFile.hpp
 * @brief The user-facing API for reading one CONTROL.NNN file.
 *
 * Opening a ControlFile decodes its volume header; nextBlock() then
 * yields the directory markers and file entries in stream order.
 */

#pragma once

#include "records/AllRecords.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace dosrestore
{
    /**
     * @brief Decodes one complete block, choosing the record kind from
     * its length tag.
     *
     * @param block The block bytes, starting with the length tag.
     * @param offset Offset of the block in its control file.
     * @return The decoded record.
     * @throws RestoreError UnknownBlockTag if the tag matches no record
     * kind, MalformedRecord if the record fails validation.
     */
    ControlBlock decodeBlock(std::span<const uint8_t> block, int64_t offset);

    /**
     * @class ControlFile
     * @brief Sequential reader for a single control file.
     */
    class ControlFile
    {
    public:
        /**
         * @brief Opens a control file and decodes its header.
         *
         * @param filepath Path to the CONTROL.NNN file.
         * @throws RestoreError MissingControlFile if the file cannot be
         * opened, MalformedRecord if it does not start with a valid
         * volume header.
         */
        explicit ControlFile(const std::string& filepath);

        /**
         * @brief Destructor.
         */
        ~ControlFile();

        // --- Core API ---

        /**
         * @brief Reads the next block after the header.
         *
         * Only directory markers and file entries may follow the header;
         * any other tag raises UnknownBlockTag before the block body is
         * read.
         *
         * @param block Receives the decoded record.
         * @return true if a block was read, false at the end of the file.
         * @throws RestoreError on an unknown tag or malformed/truncated block.
         */
        bool nextBlock(ControlBlock& block);

        // --- File Metadata Accessors ---

        const VolumeHeader& getHeader() const;

        const std::string& getFilePath() const;

    private:
        /**
         * @struct Impl
         * @brief Private implementation (PIMPL) idiom.
         */
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

} // namespace dosrestore
