/**
 * @file ControlFile.cpp
 * @brief Implementation of the ControlFile class.
 */

#include "dosrestore/ControlFile.hpp"
#include "dosrestore/Errors.hpp"
#include "ControlStream.hpp"
#include "DataBuffer.hpp"
#include <spdlog/fmt/fmt.h>

namespace dosrestore
{
    namespace
    {
        template <typename T>
        T decodeAs(std::span<const uint8_t> block, int64_t offset)
        {
            T record(offset);
            record.read(DataBuffer(block));
            return record;
        }

        std::string tagText(uint8_t tag)
        {
            return fmt::format("0x{:02X}", tag);
        }
    }

    ControlBlock decodeBlock(std::span<const uint8_t> block, int64_t offset)
    {
        if (block.empty())
        {
            throw RestoreError(ErrorCode::MalformedRecord,
                               "empty block at offset " + std::to_string(offset));
        }

        switch (block[0])
        {
        case VolumeHeader::kLength:    return decodeAs<VolumeHeader>(block, offset);
        case DirectoryMarker::kLength: return decodeAs<DirectoryMarker>(block, offset);
        case FileEntry::kLength:       return decodeAs<FileEntry>(block, offset);
        default:
            throw RestoreError(ErrorCode::UnknownBlockTag,
                               "block length tag " + tagText(block[0]) +
                               " at offset " + std::to_string(offset));
        }
    }

    /**
     * @struct ControlFile::Impl
     * @brief Private implementation (PIMPL) struct for ControlFile.
     */
    struct ControlFile::Impl
    {
        std::unique_ptr<ControlStream> stream;
        VolumeHeader header;

        explicit Impl(const std::string& filepath)
        {
            stream = std::make_unique<ControlStream>(filepath);
            readHeader();
        }

        /**
         * @brief Reads the current block body and decodes it.
         */
        ControlBlock readCurrentBlock()
        {
            const int64_t offset = stream->getCurrentBlockOffset();
            try
            {
                stream->readBody();
            }
            catch (const ControlEOF& e)
            {
                throw RestoreError(ErrorCode::MalformedRecord,
                                   "truncated block in '" + stream->getFilePath() + "': " + e.what());
            }
            return decodeBlock(stream->block(), offset);
        }

        void readHeader()
        {
            uint8_t tag = 0;
            if (!stream->readTag(tag))
            {
                throw RestoreError(ErrorCode::MalformedRecord,
                                   "control file '" + stream->getFilePath() + "' is empty");
            }
            if (tag != VolumeHeader::kLength)
            {
                throw RestoreError(ErrorCode::MalformedRecord,
                                   "control file '" + stream->getFilePath() +
                                   "' does not start with a volume header (tag " +
                                   tagText(tag) + ")");
            }
            header = std::get<VolumeHeader>(readCurrentBlock());
        }
    };

    // --- Public ControlFile Methods ---

    ControlFile::ControlFile(const std::string& filepath)
        : m_impl(std::make_unique<Impl>(filepath))
    {
    }

    ControlFile::~ControlFile()
    {
    }

    bool ControlFile::nextBlock(ControlBlock& block)
    {
        uint8_t tag = 0;
        if (!m_impl->stream->readTag(tag))
        {
            return false; // Clean EOF
        }

        if (tag != DirectoryMarker::kLength && tag != FileEntry::kLength)
        {
            throw RestoreError(ErrorCode::UnknownBlockTag,
                               "block length tag " + tagText(tag) + " at offset " +
                               std::to_string(m_impl->stream->getCurrentBlockOffset()) +
                               " of '" + m_impl->stream->getFilePath() + "'");
        }

        block = m_impl->readCurrentBlock();
        return true;
    }

    // --- Accessors ---

    const VolumeHeader& ControlFile::getHeader() const
    {
        return m_impl->header;
    }

    const std::string& ControlFile::getFilePath() const
    {
        return m_impl->stream->getFilePath();
    }

} // namespace dosrestore
