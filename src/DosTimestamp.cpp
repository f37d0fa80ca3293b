/**
 * @file DosTimestamp.cpp
 * @brief Implementation of the DosTimestamp decoder.
 */

#include "dosrestore/DosTimestamp.hpp"
#include "utils/BinaryIO.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace dosrestore
{
    DosTimestamp DosTimestamp::fromBytes(std::span<const uint8_t> bytes)
    {
        if (bytes.size() != 4)
        {
            throw std::invalid_argument(
                "DOS timestamp needs 4 bytes, got " + std::to_string(bytes.size()));
        }
        return DosTimestamp(utils::readLeWord(bytes.data()),
                            utils::readLeWord(bytes.data() + 2));
    }

    std::string DosTimestamp::toString() const
    {
        const int h = hours();
        const char* amPm = h < 12 ? "AM" : "PM";
        int h12 = h % 12;
        if (h12 == 0) h12 = 12;
        // Hours 24-31 can't occur in a sane stamp but fit in 5 bits.
        if (h >= 24) h12 = h - 12;

        return fmt::format("{:02d}/{:02d}/{:4d} {:02d}:{:02d} {}",
                           month(), day(), year(), h12, minutes(), amPm);
    }

    std::time_t DosTimestamp::toTimeT() const
    {
        std::tm tm{};
        tm.tm_year  = year() - 1900;
        tm.tm_mon   = month() - 1;
        tm.tm_mday  = day();
        tm.tm_hour  = hours();
        tm.tm_min   = minutes();
        tm.tm_sec   = seconds();
        tm.tm_isdst = -1; // let the C library decide
        return std::mktime(&tm);
    }

} // namespace dosrestore
