/**
 * @file ControlStream.hpp
 * @brief Internal class for reading length-prefixed control blocks.
 *
 * A CONTROL.NNN file is a flat run of blocks, each starting with a
 * one-byte length that counts itself. This class reads them strictly
 * forward, holding only the current block in memory.
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

class ControlEOF : public std::runtime_error {
public:
    ControlEOF()
        : std::runtime_error("unexpected EOF while reading control file") {}

    explicit ControlEOF(const std::string& what)
        : std::runtime_error("unexpected EOF while reading " + what) {}
};

namespace dosrestore
{
    class ControlStream
    {
    public:
        /**
         * @brief Constructor. Opens the control file.
         * @param filepath Path to the file.
         * @throws RestoreError (MissingControlFile) if it cannot be opened.
         */
        explicit ControlStream(const std::string& filepath);

        /**
         * @brief Destructor. Closes the file handle.
         */
        ~ControlStream();

        // --- Block Navigation ---

        /**
         * @brief Reads the length tag of the next block.
         * @param tag Receives the tag.
         * @return true if a tag was read, false on a clean end of file.
         */
        bool readTag(uint8_t& tag);

        /**
         * @brief Reads the rest of the block whose tag was just read.
         *
         * Afterwards block() covers the whole block, tag included.
         * @throws ControlEOF if the file ends inside the block.
         */
        void readBody();

        /**
         * @brief The most recently read block, starting with its tag.
         */
        std::span<const uint8_t> block() const { return m_block; }

        /**
         * @brief Gets the file offset of the most recently read tag.
         */
        int64_t getCurrentBlockOffset() const { return m_current_block_offset; }

        const std::string& getFilePath() const { return m_path; }

    private:
        void openFile(const std::string& filepath);
        void closeFile();

        std::ifstream m_fileStream;
        std::string m_path;

        std::vector<uint8_t> m_block; // Re-usable buffer

        // --- Block State ---
        int64_t m_next_offset = 0;          // Offset of the next unread byte
        int64_t m_current_block_offset = 0; // Offset of the current tag
    };

} // namespace dosrestore
