/**
 * @file Record.hpp
 * @brief Abstract base class for all control file records.
 *
 * A control file is a flat sequence of length-prefixed blocks. Each
 * block kind (volume header, directory marker, file entry) has a fixed
 * length and derives from Record, which remembers where in the control
 * file the block was found so errors can point at it.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace dosrestore
{
    class DataBuffer; // Forward-declaration

    /**
     * @class Record
     * @brief Common interface for fixed-length control records.
     */
    class Record
    {
    public:
        Record() = default;

        /**
         * @brief Constructs a Record located at a control file offset.
         * @param offset Byte offset of the block's length tag.
         */
        explicit Record(int64_t offset) : m_offset(offset) {}

        virtual ~Record() = default;

        // --- Core Deserialization Interface ---

        /**
         * @brief Decodes the record from one complete block.
         *
         * The buffer must cover exactly one block, starting with its
         * length tag. Decoders check the length tag and every constant
         * field the format defines.
         *
         * @param buffer The raw bytes of the block.
         * @return The number of bytes consumed (the block length).
         * @throws RestoreError with ErrorCode::MalformedRecord on any
         * violated invariant.
         */
        virtual size_t read(const DataBuffer& buffer) = 0;

        /**
         * @brief Gets the byte offset of this record in its control file.
         */
        int64_t getOffset() const { return m_offset; }

    protected:
        /**
         * @brief Checks the length tag against the block and the fixed length.
         */
        void checkLength(const DataBuffer& buffer, uint8_t expected, std::string_view kind) const;

        /**
         * @brief Rejects a decoded text field holding NUL or non-ASCII bytes.
         *
         * Trailing padding is already trimmed, so any NUL left is embedded
         * and would cut the name short on the host file system.
         */
        void checkText(std::string_view kind, std::string_view field, const std::string& text) const;

        /**
         * @brief Throws MalformedRecord describing this record.
         */
        [[noreturn]] void malformed(std::string_view kind, const std::string& what) const;

        int64_t m_offset = 0; ///< Offset of the block in its control file.
    };

} // namespace dosrestore
