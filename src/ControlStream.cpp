/**
 * @file ControlStream.cpp
 * @brief Implementation of the ControlStream class.
 */

#include "ControlStream.hpp"
#include "dosrestore/Errors.hpp"

namespace dosrestore
{

// --- Constructor / Destructor ---

ControlStream::ControlStream(const std::string& filepath)
    : m_path(filepath)
{
    openFile(filepath);
}

ControlStream::~ControlStream()
{
    closeFile();
}

// --- Low-Level I/O ---

void ControlStream::openFile(const std::string& filepath)
{
    m_fileStream.open(filepath, std::ios::binary);
    if (!m_fileStream.is_open())
    {
        throw RestoreError(ErrorCode::MissingControlFile,
                           "control file '" + filepath + "' not found");
    }

    m_block.reserve(256); // Every block fits in one length byte
}

void ControlStream::closeFile()
{
    if (m_fileStream.is_open()) m_fileStream.close();
}

// --- Block Navigation ---

bool ControlStream::readTag(uint8_t& tag)
{
    m_current_block_offset = m_next_offset;

    const auto c = m_fileStream.get();
    if (c == std::ifstream::traits_type::eof())
    {
        if (m_fileStream.bad())
        {
            throw RestoreError(ErrorCode::IoFailure,
                               "read error in control file '" + m_path + "'");
        }
        return false;
    }

    tag = static_cast<uint8_t>(c);
    ++m_next_offset;

    m_block.assign(1, tag);
    return true;
}

void ControlStream::readBody()
{
    const size_t length = m_block.empty() ? 0 : m_block[0];
    if (length <= 1) return;

    m_block.resize(length);
    m_fileStream.read(reinterpret_cast<char*>(m_block.data() + 1),
                      static_cast<std::streamsize>(length - 1));
    const auto got = m_fileStream.gcount();
    m_next_offset += got;

    if (got != static_cast<std::streamsize>(length - 1))
    {
        throw ControlEOF("block of " + std::to_string(length) + " bytes at offset " +
                         std::to_string(m_current_block_offset));
    }
}

} // namespace dosrestore
