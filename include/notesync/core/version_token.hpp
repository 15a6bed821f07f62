#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <string>

namespace notesync {
namespace core {

/**
 * @brief Version stamp of the stored document (a wall-clock second).
 *
 * Unlike a logical clock, the version is a physical timestamp truncated to
 * whole seconds, because that is all the RFC 1123 wire format carries:
 *
 *   Mon, 02 Jan 2006 15:04:05 GMT
 *
 * Two stamps that format identically are the same version. The default
 * constructed token is "zero": it orders before every real timestamp and
 * stands for "no version" (absent object, or a client with no copy).
 */
class VersionToken {
private:
    static constexpr int64_t kZero = std::numeric_limits<int64_t>::min();

    int64_t seconds; // Seconds since the Unix epoch, or kZero

    explicit VersionToken(int64_t unix_seconds) : seconds(unix_seconds) {}

public:
    VersionToken() : seconds(kZero) {}

    /**
     * @brief Truncate a time point down to its whole second.
     */
    static VersionToken fromTimePoint(std::chrono::system_clock::time_point tp) {
        auto secs = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch());
        return VersionToken(static_cast<int64_t>(secs.count()));
    }

    static VersionToken fromUnixSeconds(int64_t unix_seconds) {
        return VersionToken(unix_seconds);
    }

    /**
     * @brief The current wall-clock second.
     */
    static VersionToken now() {
        return fromTimePoint(std::chrono::system_clock::now());
    }

    bool isZero() const { return seconds == kZero; }

    int64_t unixSeconds() const { return seconds; }

    std::chrono::system_clock::time_point toTimePoint() const {
        return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
    }

    VersionToken addSeconds(int64_t delta) const {
        if (isZero()) return *this;
        return VersionToken(seconds + delta);
    }

    /**
     * @brief Compare two tokens.
     * @return -1 if this is older, 0 if equal, 1 if this is newer.
     */
    int compare(const VersionToken& other) const {
        if (seconds < other.seconds) return -1;
        if (seconds > other.seconds) return 1;
        return 0;
    }

    bool operator==(const VersionToken& other) const { return compare(other) == 0; }
    bool operator!=(const VersionToken& other) const { return compare(other) != 0; }
    bool operator<(const VersionToken& other) const { return compare(other) < 0; }
    bool operator>(const VersionToken& other) const { return compare(other) > 0; }
    bool operator<=(const VersionToken& other) const { return compare(other) <= 0; }
    bool operator>=(const VersionToken& other) const { return compare(other) >= 0; }

    /**
     * @brief Render as an RFC 1123 date in GMT.
     * The zero token has no wire form and renders as an empty string.
     */
    std::string format() const {
        if (isZero()) return "";

        std::time_t t = static_cast<std::time_t>(seconds);
        std::tm tm{};
        if (gmtime_r(&t, &tm) == nullptr) return "";

        std::ostringstream out;
        out.imbue(std::locale::classic());
        out << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S") << " GMT";
        return out.str();
    }

    /**
     * @brief Parse an RFC 1123 date.
     *
     * Accepted zones: GMT, UT, UTC, Z, the RFC 822 North American zones
     * (EST, EDT, CST, CDT, MST, MDT, PST, PDT) and numeric +hhmm / -hhmm.
     *
     * Day, year and time fields are fixed width, and the date must exist
     * in the calendar (no 31 Feb, no second 60).
     *
     * @return false if the text is not a well-formed date; out_token is
     *         left untouched in that case.
     */
    static bool parse(const std::string& text, VersionToken& out_token) {
        if (!hasDateShape(text)) return false;

        std::istringstream in(text);
        in.imbue(std::locale::classic());

        std::tm tm{};
        in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
        if (in.fail()) return false;

        std::string zone;
        if (!(in >> zone)) return false;

        std::string trailing;
        if (in >> trailing) return false;

        int64_t offset = 0;
        if (!zoneOffset(zone, offset)) return false;

        // timegm normalizes out-of-range fields; a date that moved was not real
        std::tm fields = tm;
        std::time_t t = timegm(&tm);
        std::tm check{};
        if (gmtime_r(&t, &check) == nullptr) return false;
        if (check.tm_year != fields.tm_year || check.tm_mon != fields.tm_mon ||
            check.tm_mday != fields.tm_mday || check.tm_hour != fields.tm_hour ||
            check.tm_min != fields.tm_min || check.tm_sec != fields.tm_sec) {
            return false;
        }

        out_token = VersionToken(static_cast<int64_t>(t) - offset);
        return true;
    }

private:
    // "Sun, 06 Nov 1994 08:49:37 " followed by a zone: '0' is a digit,
    // 'a' a letter, anything else must match exactly.
    static bool hasDateShape(const std::string& text) {
        static const char kShape[] = "aaa, 00 aaa 0000 00:00:00 ";
        const size_t length = sizeof(kShape) - 1;
        if (text.size() <= length) return false;

        for (size_t i = 0; i < length; i++) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            switch (kShape[i]) {
                case '0':
                    if (c < '0' || c > '9') return false;
                    break;
                case 'a':
                    if (!std::isalpha(c)) return false;
                    break;
                default:
                    if (c != static_cast<unsigned char>(kShape[i])) return false;
            }
        }
        return true;
    }

    // Offset east of UTC, in seconds
    static bool zoneOffset(const std::string& zone, int64_t& out_offset) {
        struct NamedZone {
            const char* name;
            int hours;
        };
        static const NamedZone kZones[] = {
            {"GMT", 0}, {"UT", 0}, {"UTC", 0}, {"Z", 0},
            {"EST", -5}, {"EDT", -4},
            {"CST", -6}, {"CDT", -5},
            {"MST", -7}, {"MDT", -6},
            {"PST", -8}, {"PDT", -7},
        };

        for (const auto& z : kZones) {
            if (zone == z.name) {
                out_offset = static_cast<int64_t>(z.hours) * 3600;
                return true;
            }
        }

        // Numeric form: +hhmm / -hhmm
        if (zone.size() != 5 || (zone[0] != '+' && zone[0] != '-')) return false;
        for (size_t i = 1; i < 5; i++) {
            if (zone[i] < '0' || zone[i] > '9') return false;
        }
        int hh = (zone[1] - '0') * 10 + (zone[2] - '0');
        int mm = (zone[3] - '0') * 10 + (zone[4] - '0');
        if (hh > 23 || mm > 59) return false;

        int64_t offset = static_cast<int64_t>(hh) * 3600 + static_cast<int64_t>(mm) * 60;
        out_offset = (zone[0] == '-') ? -offset : offset;
        return true;
    }
};

} // namespace core
} // namespace notesync
