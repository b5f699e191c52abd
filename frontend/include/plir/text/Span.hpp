// frontend/include/plir/text/Span.hpp
#pragma once
#include <cstdint>


namespace plir {

    // 토큰이 들고 다니는 소스 위치. lexer/session은 해석하지 않고 그대로 전달한다.
    struct Span {
        uint32_t file_id = 0;
        uint32_t lo = 0;   // byte offset inclusive
        uint32_t hi = 0;   // byte offset exclusive
    };

    constexpr bool operator==(const Span& a, const Span& b) {
        return a.file_id == b.file_id && a.lo == b.lo && a.hi == b.hi;
    }

    // (file_id, lo, hi) lexicographic
    constexpr bool operator<(const Span& a, const Span& b) {
        if (a.file_id != b.file_id) return a.file_id < b.file_id;
        if (a.lo != b.lo) return a.lo < b.lo;
        return a.hi < b.hi;
    }

} // namespace plir
