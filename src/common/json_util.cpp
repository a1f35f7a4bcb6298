#include "common/json_util.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

constexpr std::string_view kReplacementEscape = "\\ufffd";

// str[i] 에서 시작하는 올바른 UTF-8 멀티바이트 시퀀스 길이. 깨졌으면 0.
std::size_t utf8_sequence_length(std::string_view str, std::size_t i) {
    const auto lead = static_cast<unsigned char>(str[i]);
    std::size_t   len = 0;
    unsigned char lo  = 0x80;
    unsigned char hi  = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;  // overlong
        if (lead == 0xED) hi = 0x9F;  // surrogate
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;  // overlong
        if (lead == 0xF4) hi = 0x8F;  // > U+10FFFF
    } else {
        return 0;
    }
    if (i + len > str.size()) {
        return 0;
    }
    for (std::size_t k = 1; k < len; ++k) {
        const auto cont = static_cast<unsigned char>(str[i + k]);
        const auto min  = (k == 1) ? lo : static_cast<unsigned char>(0x80);
        const auto max  = (k == 1) ? hi : static_cast<unsigned char>(0xBF);
        if (cont < min || cont > max) {
            return 0;
        }
    }
    return len;
}

}  // namespace

std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (std::size_t i = 0; i < str.size(); ++i) {
        const auto ch = static_cast<unsigned char>(str[i]);
        if (ch >= 0x80) {
            const std::size_t len = utf8_sequence_length(str, i);
            if (len == 0) {
                result += kReplacementEscape;
            } else {
                result.append(str.substr(i, len));
                i += len - 1;
            }
            continue;
        }
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);  // gmtime 의 정적 버퍼 공유 회피 (감사 스레드 + 호출자 스레드)

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}
