// frontend/include/plir/syntax/LiteralConst.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string_view>


namespace plir::syntax {

    // Surface shape of a literal constant body, e.g. the `9` in (con integer 9).
    //
    // The lexer never interprets the body. It only checks which of the four
    // shapes it has and hands the raw text to the type-specific parser, which
    // owns quote stripping and escape sequences.
    //
    // "Printable" means code points 32..0x10FFFF: spaces are fine, tabs are not.
    enum class LiteralConst : uint8_t {
        kEmptyBrackets,       // ()
        kSingleQuotedChars,   // '...', possibly empty
        kDoubleQuotedChars,   // "...", possibly empty
        kUnQuotedChars,       // non-empty, no '(' or ')', no leading quote; outer spaces ignored
    };

    constexpr std::string_view literal_const_text(LiteralConst l) {
        switch (l) {
            case LiteralConst::kEmptyBrackets: return "lit ()";
            case LiteralConst::kSingleQuotedChars: return "lit '";
            case LiteralConst::kDoubleQuotedChars: return "lit \"";
            case LiteralConst::kUnQuotedChars: return "lit";
        }

        return "lit ?";
    }

    constexpr std::string_view literal_const_name(LiteralConst l) {
        switch (l) {
            case LiteralConst::kEmptyBrackets: return "empty_brackets";
            case LiteralConst::kSingleQuotedChars: return "single_quoted";
            case LiteralConst::kDoubleQuotedChars: return "double_quoted";
            case LiteralConst::kUnQuotedChars: return "unquoted";
        }

        return "unknown";
    }

    /// @brief 리터럴 본문의 모양을 분류한다. 어느 모양에도 맞지 않으면 nullopt.
    /// The body is the raw text between the type name and the closing ')'
    /// of the constant, exactly as captured by the scanner.
    std::optional<LiteralConst> classify_literal_body(std::string_view body);

    // Strips the leading/trailing spaces that are not part of a body.
    std::string_view trim_literal_body(std::string_view body);

} // namespace plir::syntax
