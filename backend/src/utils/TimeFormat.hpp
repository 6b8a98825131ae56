#pragma once
#include <ctime>
#include <string>

// RFC 3339 timestamps as stored in the progress files,
// e.g. "2024-05-01T10:20:30+02:00" or "2024-05-01T08:20:30Z".
namespace TimeFormat
{
    // Formats in local time with its numeric offset ("Z" when the offset is zero).
    std::string toRfc3339(std::time_t t);

    // Accepts an optional fractional-seconds part (dropped) and either "Z" or
    // a "+hh:mm" / "-hh:mm" offset. Returns false on anything else.
    bool fromRfc3339(const std::string& text, std::time_t& out);

    // Days since 1970-01-01 for a proleptic Gregorian civil date.
    long long daysFromCivil(int year, unsigned month, unsigned day);

    // Calendar day number of t in UTC.
    long long utcDayNumber(std::time_t t);

    // Local midnight at the start of the day containing t.
    std::time_t localMidnight(std::time_t t);
}
