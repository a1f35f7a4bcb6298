#pragma once

// ---------------------------------------------------------------------------
// json_util.hpp
//
// 구조화 로그 / 판정 JSON 직렬화에 공통으로 쓰는 헬퍼.
// StructuredLogger 와 Decision 직렬화가 같은 이스케이프 규칙을 공유해야
// 로그 수집기에서 필드 파싱이 어긋나지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <ostream>
#include <string>
#include <string_view>

// JSON 문자열 이스케이프 (따옴표, 역슬래시, 제어 문자)
// 올바른 UTF-8 시퀀스는 그대로 두고, 깨진 바이트는 바이트마다 \ufffd 로 바꾼다.
// 쿼리 원문이 어떤 바이트를 담고 있어도 출력 줄은 유효한 JSON 이다.
[[nodiscard]] std::string escape_json_string(std::string_view str);

// ["a","b"] 형태로 출력. to_text 는 항목을 string_view 로 바꾼다.
template <typename Range, typename ToText>
void write_string_array(std::ostream& json, const Range& items, ToText to_text) {
    json << '[';
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            json << ',';
        }
        first = false;
        json << '"' << escape_json_string(to_text(item)) << '"';
    }
    json << ']';
}

// ISO8601 UTC 타임스탬프 (밀리초 포함, 예: 2024-01-01T00:00:00.000Z)
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
