// frontend/include/plir/lex/Token.hpp
#pragma once
#include <plir/lex/Unique.hpp>
#include <plir/num/Natural.hpp>
#include <plir/syntax/Keyword.hpp>
#include <plir/syntax/LiteralConst.hpp>
#include <plir/text/Span.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>


namespace plir {

    // ---- payloads (one per token shape) ----

    struct TkName {
        std::string text;
        Unique unique{};    // assigned by IdentifierState during lexing
    };

    struct TkBuiltinFnId {
        std::string text;
    };

    struct TkBuiltinTypeId {
        std::string text;
    };

    // what follows `con`: a builtin type name and the literal constant shape
    struct TkConArgs {
        std::string type_name;
        syntax::LiteralConst lit = syntax::LiteralConst::kUnQuotedChars;
        std::string body;   // raw literal text, uninterpreted
    };

    struct TkKeyword {
        syntax::Keyword kw = syntax::Keyword::kLam;
    };

    struct TkLiteralConst {
        syntax::LiteralConst lit = syntax::LiteralConst::kUnQuotedChars;
        std::string body;   // raw literal text, uninterpreted
    };

    struct TkNatural {
        num::Natural value;
    };

    struct TkEof {};

    // ---- payload comparisons: members in declaration order ----

    inline bool operator==(const TkName& a, const TkName& b) {
        return a.text == b.text && a.unique == b.unique;
    }
    inline bool operator<(const TkName& a, const TkName& b) {
        return std::tie(a.text, a.unique) < std::tie(b.text, b.unique);
    }

    inline bool operator==(const TkBuiltinFnId& a, const TkBuiltinFnId& b) { return a.text == b.text; }
    inline bool operator<(const TkBuiltinFnId& a, const TkBuiltinFnId& b)  { return a.text < b.text; }

    inline bool operator==(const TkBuiltinTypeId& a, const TkBuiltinTypeId& b) { return a.text == b.text; }
    inline bool operator<(const TkBuiltinTypeId& a, const TkBuiltinTypeId& b)  { return a.text < b.text; }

    inline bool operator==(const TkConArgs& a, const TkConArgs& b) {
        return a.type_name == b.type_name && a.lit == b.lit && a.body == b.body;
    }
    inline bool operator<(const TkConArgs& a, const TkConArgs& b) {
        return std::tie(a.type_name, a.lit, a.body) < std::tie(b.type_name, b.lit, b.body);
    }

    constexpr bool operator==(const TkKeyword& a, const TkKeyword& b) { return a.kw == b.kw; }
    constexpr bool operator<(const TkKeyword& a, const TkKeyword& b)  { return a.kw < b.kw; }

    inline bool operator==(const TkLiteralConst& a, const TkLiteralConst& b) {
        return a.lit == b.lit && a.body == b.body;
    }
    inline bool operator<(const TkLiteralConst& a, const TkLiteralConst& b) {
        return std::tie(a.lit, a.body) < std::tie(b.lit, b.body);
    }

    inline bool operator==(const TkNatural& a, const TkNatural& b) { return a.value == b.value; }
    inline bool operator<(const TkNatural& a, const TkNatural& b)  { return a.value < b.value; }

    constexpr bool operator==(const TkEof&, const TkEof&) { return true; }
    constexpr bool operator<(const TkEof&, const TkEof&)  { return false; }

    using TokenData = std::variant<
        TkName,
        TkBuiltinFnId,
        TkBuiltinTypeId,
        TkConArgs,
        TkKeyword,
        TkLiteralConst,
        TkNatural,
        TkEof
    >;

    // tag mirroring TokenData's alternatives, in the same order
    enum class TokenKind : uint8_t {
        kName,
        kBuiltinFnId,
        kBuiltinTypeId,
        kConArgs,
        kKeyword,
        kLiteralConst,
        kNatural,
        kEof,
    };

    static_assert(std::variant_size_v<TokenData> == static_cast<size_t>(TokenKind::kEof) + 1);

    struct Token {
        Span span{};
        TokenData data{TkEof{}};

        TokenKind kind() const { return static_cast<TokenKind>(data.index()); }

        template <class T>
        bool is() const { return std::holds_alternative<T>(data); }

        template <class T>
        const T& as() const { return std::get<T>(data); }
    };

    // 토큰 비교: span 먼저, 그 다음 payload. 다른 variant끼리는 TokenData 순서를 따른다.
    inline bool operator==(const Token& a, const Token& b) {
        return a.span == b.span && a.data == b.data;
    }
    inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }
    inline bool operator<(const Token& a, const Token& b) {
        if (!(a.span == b.span)) return a.span < b.span;
        return a.data < b.data;
    }

    constexpr std::string_view token_kind_name(TokenKind k) {
        switch (k) {
            case TokenKind::kName: return "name";
            case TokenKind::kBuiltinFnId: return "builtin_fn";
            case TokenKind::kBuiltinTypeId: return "builtin_type";
            case TokenKind::kConArgs: return "con_args";
            case TokenKind::kKeyword: return "keyword";
            case TokenKind::kLiteralConst: return "literal_const";
            case TokenKind::kNatural: return "natural";
            case TokenKind::kEof: return "eof";
        }

        return "unknown";
    }

    // Diagnostic spelling of a token. EOF renders as "".
    // Not meant to be lexed again.
    std::string render_token(const Token& t);

    // tokens joined by a single space, empty renderings skipped
    std::string render_tokens(const std::vector<Token>& toks);

    // "<kind>@<lo>..<hi> <rendering>" per line, for token dumps
    std::string dump_tokens(const std::vector<Token>& toks);

} // namespace plir
