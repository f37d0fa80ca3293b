/**
 * @file DosTimestamp.hpp
 * @brief Packed DOS date/time stamp as stored in a file entry record.
 *
 * The stamp is two little-endian 16-bit words, time of day first:
 *
 *   time word: bits  4:0  seconds/2 (0-29)
 *              bits 10:5  minutes   (0-59)
 *              bits 15:11 hours     (0-23)
 *   date word: bits  4:0  day       (1-31)
 *              bits  8:5  month     (1-12)
 *              bits 15:9  year - 1980
 *
 * No calendar validation is done. A month of 0 decodes as 0 and is
 * displayed as such.
 */

#pragma once

#include <cstdint>
#include <ctime>
#include <span>
#include <string>

namespace dosrestore
{
    struct DosTimestamp
    {
        uint16_t time_word = 0; ///< Raw time-of-day word
        uint16_t date_word = 0; ///< Raw date word

        DosTimestamp() = default;
        DosTimestamp(uint16_t timeWord, uint16_t dateWord)
            : time_word(timeWord), date_word(dateWord) {}

        /**
         * @brief Decodes the 4-byte on-disk form.
         * @throws std::invalid_argument if bytes is not exactly 4 bytes long.
         */
        static DosTimestamp fromBytes(std::span<const uint8_t> bytes);

        /// Stored seconds field, in 2-second units (0-29).
        int secondsHalf() const { return time_word & 0x1F; }
        /// Seconds, doubled back from the stored 2-second units (0-58).
        int seconds() const { return secondsHalf() * 2; }
        int minutes() const { return (time_word >> 5) & 0x3F; }
        int hours() const { return (time_word >> 11) & 0x1F; }

        int day() const { return date_word & 0x1F; }
        int month() const { return (date_word >> 5) & 0x0F; }
        int year() const { return ((date_word >> 9) & 0x7F) + 1980; }

        /**
         * @brief Formats as "MM/DD/YYYY hh:mm AM|PM".
         *
         * 12-hour clock; hour 0 is shown as 12 AM and hour 12 as 12 PM.
         */
        std::string toString() const;

        /**
         * @brief Interprets the stamp as local time.
         * @return Seconds since the epoch, or -1 if mktime() rejects it.
         */
        std::time_t toTimeT() const;

        bool operator==(const DosTimestamp&) const = default;
    };

} // namespace dosrestore
