// frontend/include/plir/syntax/Keyword.hpp
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>


namespace plir::syntax {

    // 예약어. typed/untyped 양쪽 문법이 lexer를 공유하므로 하나의 열거로 둔다.
    enum class Keyword : uint8_t {
        kLam,
        kProgram,
        kCon,       // (con tyname) or (con tyname const)
        kBuiltin,   // next id is a builtin name, not a Name
        kError,

        // typed only
        kAbs,
        kFun,
        kAll,
        kType,
        kIFix,
        kIWrap,
        kUnwrap,

        // untyped only
        kForce,
        kDelay,
    };

    inline constexpr std::array<Keyword, 14> k_all_keywords = {
        Keyword::kLam,
        Keyword::kProgram,
        Keyword::kCon,
        Keyword::kBuiltin,
        Keyword::kError,
        Keyword::kAbs,
        Keyword::kFun,
        Keyword::kAll,
        Keyword::kType,
        Keyword::kIFix,
        Keyword::kIWrap,
        Keyword::kUnwrap,
        Keyword::kForce,
        Keyword::kDelay,
    };

    static_assert(static_cast<size_t>(Keyword::kDelay) + 1 == k_all_keywords.size(),
                  "k_all_keywords must list every Keyword");

    constexpr std::string_view keyword_text(Keyword k) {
        switch (k) {
            case Keyword::kLam: return "lam";
            case Keyword::kProgram: return "program";
            case Keyword::kCon: return "con";
            case Keyword::kBuiltin: return "builtin";
            case Keyword::kError: return "error";
            case Keyword::kAbs: return "abs";
            case Keyword::kFun: return "fun";
            case Keyword::kAll: return "all";
            case Keyword::kType: return "type";
            case Keyword::kIFix: return "ifix";
            case Keyword::kIWrap: return "iwrap";
            case Keyword::kUnwrap: return "unwrap";
            case Keyword::kForce: return "force";
            case Keyword::kDelay: return "delay";
        }

        return "unknown";
    }

    // keyword matching table for the scanner: derived from k_all_keywords only
    constexpr std::optional<Keyword> keyword_from_text(std::string_view text) {
        for (const auto k : k_all_keywords) {
            if (keyword_text(k) == text) return k;
        }
        return std::nullopt;
    }

} // namespace plir::syntax
