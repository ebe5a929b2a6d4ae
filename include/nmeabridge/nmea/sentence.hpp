#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <utility>

namespace nmeabridge::nmea {

    // ─── NMEA 0183 sentence helpers ─────────────────────────────────────────────

    // XOR of every character between the start delimiter and '*'
    inline u8 checksum(const dp::String &body) noexcept {
        u8 cs = 0;
        for (char c : body)
            cs ^= static_cast<u8>(c);
        return cs;
    }

    inline dp::String hex_byte(u8 v) {
        static constexpr char digits[] = "0123456789ABCDEF";
        dp::String out;
        out += digits[(v >> 4) & 0x0F];
        out += digits[v & 0x0F];
        return out;
    }

    // "IIDBT,..." -> "$IIDBT,...*hh\r\n"
    inline dp::String build(const dp::String &body) { return "$" + body + "*" + hex_byte(checksum(body)) + "\r\n"; }

    inline dp::String strip_line_end(const dp::String &s) {
        usize end = s.size();
        while (end > 0 && (s[end - 1] == '\r' || s[end - 1] == '\n' || s[end - 1] == ' '))
            --end;
        usize begin = 0;
        while (begin < end && s[begin] == ' ')
            ++begin;
        return s.substr(begin, end - begin);
    }

    inline bool is_upper(char c) noexcept { return c >= 'A' && c <= 'Z'; }
    inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
    inline bool is_hex_upper(char c) noexcept { return is_digit(c) || (c >= 'A' && c <= 'F'); }

    // Structure: $TTSSS[,fields]*HH where TT is a two-letter talker and SSS a
    // three-character sentence id. Proprietary "$P..." sentences fit the same shape.
    inline Result<void> validate(const dp::String &raw) {
        dp::String s = strip_line_end(raw);
        if (s.size() < 9)
            return Result<void>::err(Error::invalid_sentence("sentence too short"));
        if (s[0] != '$' && s[0] != '!')
            return Result<void>::err(Error::invalid_sentence("missing start delimiter"));
        if (!is_upper(s[1]) || !is_upper(s[2]))
            return Result<void>::err(Error::invalid_sentence("invalid talker id"));
        for (usize i = 3; i < 6; ++i) {
            if (!is_upper(s[i]) && !is_digit(s[i]))
                return Result<void>::err(Error::invalid_sentence("invalid sentence type"));
        }
        usize star = s.size() - 3;
        if (s[star] != '*' || !is_hex_upper(s[star + 1]) || !is_hex_upper(s[star + 2]))
            return Result<void>::err(Error::invalid_sentence("missing checksum"));
        if (star != 6 && s[6] != ',')
            return Result<void>::err(Error::invalid_sentence("invalid field separator"));
        for (usize i = 1; i < star; ++i) {
            char c = s[i];
            if (c == '$' || c == '*' || c == '\r' || c == '\n' || static_cast<unsigned char>(c) < 0x20 ||
                static_cast<unsigned char>(c) > 0x7E)
                return Result<void>::err(Error::invalid_sentence("reserved character in body"));
        }
        u8 expected = static_cast<u8>(std::strtol(s.c_str() + star + 1, nullptr, 16));
        u8 computed = checksum(s.substr(1, star - 1));
        if (computed != expected) {
            return Result<void>::err(Error::invalid_sentence("checksum mismatch: expected " + hex_byte(computed) +
                                                             " got " + hex_byte(expected)));
        }
        return {};
    }

    inline bool has_valid_checksum(const dp::String &s) { return validate(s).is_ok(); }

    // Same sentence with an inverted checksum; line endings are kept
    inline dp::String corrupt_checksum(const dp::String &s) {
        usize star = s.rfind('*');
        if (star == dp::String::npos || star + 3 > s.size())
            return s;
        u8 cs = static_cast<u8>(std::strtol(s.substr(star + 1, 2).c_str(), nullptr, 16));
        dp::String out = s;
        dp::String bad = hex_byte(static_cast<u8>(cs ^ 0xFF));
        out[star + 1] = bad[0];
        out[star + 2] = bad[1];
        return out;
    }

    // Three-character sentence id, e.g. "DBT"
    inline dp::String sentence_type(const dp::String &s) {
        if (s.size() < 6)
            return "";
        return s.substr(3, 3);
    }

    // Fields between the start delimiter and '*'; fields[0] is the address field
    inline dp::Vector<dp::String> split_fields(const dp::String &sentence) {
        dp::Vector<dp::String> fields;
        dp::String current;
        usize i = (!sentence.empty() && (sentence[0] == '$' || sentence[0] == '!')) ? 1 : 0;
        for (; i < sentence.size(); ++i) {
            char c = sentence[i];
            if (c == ',' || c == '*') {
                fields.push_back(current);
                current.clear();
                if (c == '*')
                    return fields;
            } else if (c == '\r' || c == '\n') {
                break;
            } else {
                current += c;
            }
        }
        fields.push_back(current);
        return fields;
    }

    // ─── Field formatting ───────────────────────────────────────────────────────
    inline dp::String fixed(f64 v, int decimals) {
        char buf[64];
        if (std::fabs(v) < 0.5 * std::pow(10.0, -decimals))
            v = 0.0;
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
        return dp::String(buf);
    }

    // ddmm.mmmm / dddmm.mmmm with hemisphere letter
    inline std::pair<dp::String, dp::String> format_lat(f64 lat) {
        f64 total_min = std::round(std::fabs(lat) * 60.0 * 10000.0) / 10000.0;
        int deg = static_cast<int>(total_min / 60.0);
        f64 min = total_min - deg * 60.0;
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%02d%07.4f", deg, min);
        return {dp::String(buf), lat < 0.0 ? "S" : "N"};
    }

    inline std::pair<dp::String, dp::String> format_lon(f64 lon) {
        f64 total_min = std::round(std::fabs(lon) * 60.0 * 10000.0) / 10000.0;
        int deg = static_cast<int>(total_min / 60.0);
        f64 min = total_min - deg * 60.0;
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%03d%07.4f", deg, min);
        return {dp::String(buf), lon < 0.0 ? "W" : "E"};
    }

    // ─── UTC helpers for time fields ────────────────────────────────────────────
    struct UtcTime {
        i32 year = 1970;
        u32 month = 1;
        u32 day = 1;
        u32 hour = 0;
        u32 minute = 0;
        u32 second = 0;
        u32 centis = 0;
        i64 days_since_epoch = 0;
        f64 seconds_of_day = 0.0;
    };

    inline UtcTime to_utc(u64 epoch_ms) {
        UtcTime t;
        i64 days = static_cast<i64>(epoch_ms / 86400000ULL);
        u64 ms_of_day = epoch_ms % 86400000ULL;
        t.days_since_epoch = days;
        t.seconds_of_day = static_cast<f64>(ms_of_day) / 1000.0;
        t.hour = static_cast<u32>(ms_of_day / 3600000ULL);
        t.minute = static_cast<u32>((ms_of_day / 60000ULL) % 60);
        t.second = static_cast<u32>((ms_of_day / 1000ULL) % 60);
        t.centis = static_cast<u32>((ms_of_day % 1000ULL) / 10);

        // civil-from-days
        i64 z = days + 719468;
        i64 era = (z >= 0 ? z : z - 146096) / 146097;
        i64 doe = z - era * 146097;
        i64 yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        i64 y = yoe + era * 400;
        i64 doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        i64 mp = (5 * doy + 2) / 153;
        t.day = static_cast<u32>(doy - (153 * mp + 2) / 5 + 1);
        t.month = static_cast<u32>(mp < 10 ? mp + 3 : mp - 9);
        t.year = static_cast<i32>(t.month <= 2 ? y + 1 : y);
        return t;
    }

    inline dp::String hhmmss(const UtcTime &t) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%02u%02u%02u.%02u", t.hour, t.minute, t.second, t.centis);
        return dp::String(buf);
    }

    inline dp::String ddmmyy(const UtcTime &t) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%02u%02u%02d", t.day, t.month, t.year % 100);
        return dp::String(buf);
    }

} // namespace nmeabridge::nmea
