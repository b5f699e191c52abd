// frontend/src/syntax/literal_const.cpp
#include <plir/syntax/LiteralConst.hpp>
#include <plir/text/Utf8.hpp>


namespace plir::syntax {

    namespace {

        bool is_printable_(uint32_t cp) {
            return cp >= 32 && cp <= 0x10FFFF;
        }

        // every code point in s is printable and, when forbid_parens, not '(' / ')'
        bool all_printable_(std::string_view s, bool forbid_parens) {
            size_t i = 0;
            while (i < s.size()) {
                uint32_t cp = 0;
                if (!text::utf8_decode_strict(s, i, cp)) return false;
                if (!is_printable_(cp)) return false;
                if (forbid_parens && (cp == '(' || cp == ')')) return false;
            }
            return true;
        }

        // s starts with quote q. ok only if the matching close quote is the last
        // character; backslash escapes the next character.
        bool is_quoted_run_(std::string_view s, char q) {
            if (s.size() < 2) return false;

            size_t i = 1;
            while (i < s.size()) {
                const char c = s[i];
                if (c == '\\') {
                    i += 2;
                    continue;
                }
                if (c == q) break;
                ++i;
            }

            if (i != s.size() - 1) return false; // unterminated or trailing text
            return all_printable_(s.substr(1, s.size() - 2), /*forbid_parens=*/false);
        }

    } // namespace

    std::string_view trim_literal_body(std::string_view body) {
        size_t lo = 0;
        size_t hi = body.size();
        while (lo < hi && body[lo] == ' ') ++lo;
        while (hi > lo && body[hi - 1] == ' ') --hi;
        return body.substr(lo, hi - lo);
    }

    std::optional<LiteralConst> classify_literal_body(std::string_view body) {
        const std::string_view s = trim_literal_body(body);
        if (s.empty()) return std::nullopt;

        if (s == "()") return LiteralConst::kEmptyBrackets;

        if (s.front() == '\'') {
            if (is_quoted_run_(s, '\'')) return LiteralConst::kSingleQuotedChars;
            return std::nullopt;
        }

        if (s.front() == '"') {
            if (is_quoted_run_(s, '"')) return LiteralConst::kDoubleQuotedChars;
            return std::nullopt;
        }

        if (all_printable_(s, /*forbid_parens=*/true)) return LiteralConst::kUnQuotedChars;
        return std::nullopt;
    }

} // namespace plir::syntax
