#include "dsync/core/timestamp.hpp"

#include <sys/stat.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dsync {
namespace {

constexpr std::int64_t kMicrosPerSecond = 1'000'000;

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm)
std::int64_t days_from_civil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const auto yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool read_digits(const std::string& text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

bool skip_offset(const std::string& text, std::size_t pos) {
    if (pos == text.size()) {
        return true;
    }
    if (text[pos] == 'Z' || text[pos] == 'z') {
        return pos + 1 == text.size();
    }
    if (text[pos] != '+' && text[pos] != '-') {
        return false;
    }
    ++pos;
    int hours = 0;
    int minutes = 0;
    if (!read_digits(text, pos, 2, hours)) {
        return false;
    }
    if (pos < text.size() && text[pos] == ':') {
        ++pos;
    }
    if (pos < text.size() && !read_digits(text, pos, 2, minutes)) {
        return false;
    }
    return pos == text.size() && hours <= 23 && minutes <= 59;
}

} // namespace

NaiveMicros naive_from_fields(int year, unsigned month, unsigned day,
                              int hour, int minute, int second,
                              std::int64_t micros) {
    const std::int64_t days = days_from_civil(year, month, day);
    const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
    return seconds * kMicrosPerSecond + micros;
}

std::optional<NaiveMicros> parse_iso8601_naive(const std::string& text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return std::nullopt;
    }

    std::int64_t micros = 0;
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        std::int64_t scale = 100000;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (scale > 0) {
                micros += (text[pos] - '0') * scale;
                scale /= 10;
            }
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
    }

    if (!skip_offset(text, pos)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    return naive_from_fields(year, static_cast<unsigned>(month), static_cast<unsigned>(day),
                             hour, minute, second, micros);
}

std::optional<NaiveMicros> local_mtime_naive(const std::filesystem::path& path) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return std::nullopt;
    }

    const std::time_t seconds = info.st_mtim.tv_sec;
    std::tm local{};
    if (::localtime_r(&seconds, &local) == nullptr) {
        return std::nullopt;
    }

    return naive_from_fields(local.tm_year + 1900,
                             static_cast<unsigned>(local.tm_mon + 1),
                             static_cast<unsigned>(local.tm_mday),
                             local.tm_hour, local.tm_min, local.tm_sec,
                             info.st_mtim.tv_nsec / 1000);
}

std::string format_naive(NaiveMicros value) {
    std::int64_t seconds = value / kMicrosPerSecond;
    if (value < 0 && value % kMicrosPerSecond != 0) {
        --seconds;
    }
    const auto t = static_cast<std::time_t>(seconds);
    std::tm fields{};
    ::gmtime_r(&t, &fields);
    std::ostringstream oss;
    oss << std::put_time(&fields, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

} // namespace dsync
