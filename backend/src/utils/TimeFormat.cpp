#include "TimeFormat.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace
{
    bool readNumber(const std::string& s, size_t pos, size_t len, int& out) {
        if (pos + len > s.size()) return false;
        int v = 0;
        for (size_t i = pos; i < pos + len; ++i) {
            if (!std::isdigit((unsigned char)s[i])) return false;
            v = v * 10 + (s[i] - '0');
        }
        out = v;
        return true;
    }

    unsigned daysInMonth(int year, unsigned month) {
        static const unsigned days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        if (month == 2 && leap) return 29;
        return days[month - 1];
    }
}

namespace TimeFormat
{
    std::string toRfc3339(std::time_t t) {
        std::tm local{};
        localtime_r(&t, &local);

        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
        std::string out(buf);

        long offset = local.tm_gmtoff;
        if (offset == 0) {
            out += "Z";
            return out;
        }

        char sign = offset < 0 ? '-' : '+';
        long abs_offset = std::labs(offset);
        char zone[8];
        std::snprintf(zone, sizeof(zone), "%c%02ld:%02ld", sign, abs_offset / 3600, (abs_offset % 3600) / 60);
        out += zone;
        return out;
    }

    bool fromRfc3339(const std::string& text, std::time_t& out) {
        int year, month, day, hour, minute, second;
        if (!readNumber(text, 0, 4, year) || text.size() < 20) return false;
        if (text[4] != '-' || text[7] != '-' || text[13] != ':' || text[16] != ':') return false;
        char sep = text[10];
        if (sep != 'T' && sep != 't' && sep != ' ') return false;
        if (!readNumber(text, 5, 2, month) || !readNumber(text, 8, 2, day) ||
            !readNumber(text, 11, 2, hour) || !readNumber(text, 14, 2, minute) ||
            !readNumber(text, 17, 2, second))
            return false;

        if (month < 1 || month > 12) return false;
        if (day < 1 || static_cast<unsigned>(day) > daysInMonth(year, month)) return false;
        if (hour > 23 || minute > 59 || second > 60) return false;

        size_t pos = 19;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t digits = 0;
            while (pos < text.size() && std::isdigit((unsigned char)text[pos])) {
                ++pos;
                ++digits;
            }
            if (digits == 0) return false;
        }

        long offset = 0;
        if (pos >= text.size()) return false;
        if (text[pos] == 'Z' || text[pos] == 'z') {
            ++pos;
        }
        else if (text[pos] == '+' || text[pos] == '-') {
            int oh, om;
            if (!readNumber(text, pos + 1, 2, oh) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
                !readNumber(text, pos + 4, 2, om))
                return false;
            if (oh > 23 || om > 59) return false;
            offset = oh * 3600L + om * 60L;
            if (text[pos] == '-') offset = -offset;
            pos += 6;
        }
        else {
            return false;
        }
        if (pos != text.size()) return false;

        long long days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        long long secs = days * 86400LL + hour * 3600LL + minute * 60LL + second - offset;
        out = static_cast<std::time_t>(secs);
        return true;
    }

    long long daysFromCivil(int year, unsigned month, unsigned day) {
        year -= month <= 2 ? 1 : 0;
        const long long era = (year >= 0 ? year : year - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(year - era * 400);
        const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<long long>(doe) - 719468;
    }

    long long utcDayNumber(std::time_t t) {
        long long secs = static_cast<long long>(t);
        long long days = secs / 86400;
        if (secs % 86400 < 0) --days;
        return days;
    }

    std::time_t localMidnight(std::time_t t) {
        std::tm local{};
        localtime_r(&t, &local);
        local.tm_hour = 0;
        local.tm_min = 0;
        local.tm_sec = 0;
        local.tm_isdst = -1;
        return std::mktime(&local);
    }
}
