/**
 * @file time.cpp
 * @brief ISO-8601 parsing and formatting on top of <chrono> calendar types.
 * @author ConstellationPlanner contributors
 */

#include "core/time.hpp"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace constellation_planner {

namespace {

bool read_int(std::string_view text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) return false;
    const char* first = text.data() + pos;
    auto [ptr, ec] = std::from_chars(first, first + len, out);
    return ec == std::errc{} && ptr == first + len;
}

Error malformed(std::string_view text, std::string_view why) {
    return Error{"Malformed timestamp '" + std::string{text} + "': " + std::string{why}};
}

}  // anonymous namespace

Result<Timestamp> parse_iso8601(std::string_view text) {
    using namespace std::chrono;

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!read_int(text, 0, 4, y) || text.size() < 19 || text[4] != '-' ||
        !read_int(text, 5, 2, mo) || text[7] != '-' ||
        !read_int(text, 8, 2, d) || (text[10] != 'T' && text[10] != ' ') ||
        !read_int(text, 11, 2, h) || text[13] != ':' ||
        !read_int(text, 14, 2, mi) || text[16] != ':' ||
        !read_int(text, 17, 2, s)) {
        return malformed(text, "expected YYYY-MM-DDTHH:MM:SS");
    }

    size_t pos = 19;
    nanoseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t value = 0;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                value = value * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return malformed(text, "empty fractional seconds");
        for (; digits < 9; ++digits) value *= 10;
        fraction = nanoseconds{value};
    }

    if (pos >= text.size()) {
        return malformed(text, "missing UTC offset");
    }

    minutes offset{0};
    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        const int sign = text[pos] == '-' ? -1 : 1;
        int oh = 0, om = 0;
        if (!read_int(text, pos + 1, 2, oh) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !read_int(text, pos + 4, 2, om)) {
            return malformed(text, "offset must be ±HH:MM");
        }
        offset = minutes{sign * (oh * 60 + om)};
        pos += 6;
    } else {
        return malformed(text, "unexpected character after seconds");
    }

    if (pos != text.size()) return malformed(text, "trailing characters");

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                             day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
        return malformed(text, "field out of range");
    }

    auto tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} + fraction - offset;
    return time_point_cast<Timestamp::duration>(tp);
}

std::string format_iso8601(Timestamp ts) {
    using namespace std::chrono;

    const auto days_part = floor<days>(ts);
    const year_month_day ymd{days_part};
    const hh_mm_ss hms{floor<milliseconds>(ts - days_part)};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << hms.hours().count() << ':'
        << std::setw(2) << hms.minutes().count() << ':'
        << std::setw(2) << hms.seconds().count();
    if (hms.subseconds().count() != 0) {
        oss << '.' << std::setw(3) << hms.subseconds().count();
    }
    oss << 'Z';
    return oss.str();
}

}  // namespace constellation_planner
