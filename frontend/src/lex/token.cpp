// frontend/src/lex/token.cpp
#include <plir/lex/Token.hpp>

#include <sstream>
#include <type_traits>


namespace plir {

    namespace {
        template <class>
        inline constexpr bool always_false_v = false;
    } // namespace

    std::string render_token(const Token& t) {
        return std::visit([](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;

            if constexpr (std::is_same_v<T, TkName>) {
                return x.text;
            } else if constexpr (std::is_same_v<T, TkNatural>) {
                return x.value.to_string();
            } else if constexpr (std::is_same_v<T, TkBuiltinFnId>) {
                return x.text;
            } else if constexpr (std::is_same_v<T, TkBuiltinTypeId>) {
                return x.text;
            } else if constexpr (std::is_same_v<T, TkConArgs>) {
                std::string s = x.type_name;
                s += ' ';
                s += syntax::literal_const_text(x.lit);
                return s;
            } else if constexpr (std::is_same_v<T, TkLiteralConst>) {
                return std::string(syntax::literal_const_text(x.lit));
            } else if constexpr (std::is_same_v<T, TkKeyword>) {
                return std::string(syntax::keyword_text(x.kw));
            } else if constexpr (std::is_same_v<T, TkEof>) {
                return std::string{};
            } else {
                static_assert(always_false_v<T>, "render_token: unhandled token variant");
            }
        }, t.data);
    }

    std::string render_tokens(const std::vector<Token>& toks) {
        std::string out;
        for (const auto& t : toks) {
            std::string s = render_token(t);
            if (s.empty()) continue;
            if (!out.empty()) out += ' ';
            out += s;
        }
        return out;
    }

    std::string dump_tokens(const std::vector<Token>& toks) {
        std::ostringstream oss;
        for (const auto& t : toks) {
            oss << token_kind_name(t.kind()) << "@" << t.span.lo << ".." << t.span.hi;

            const std::string s = render_token(t);
            if (!s.empty()) oss << " " << s;

            if (t.is<TkName>()) oss << " #" << t.as<TkName>().unique.value();
            oss << "\n";
        }
        return oss.str();
    }

} // namespace plir
