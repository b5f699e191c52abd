#include <plir/lex/Token.hpp>

#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace {

    using namespace plir;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static num::Natural nat_(const char* dec) {
        num::Natural n;
        (void)num::Natural::parse_dec(dec, n);
        return n;
    }

    // one token of every variant, in TokenData order
    static std::vector<Token> one_of_each_() {
        return {
            Token{Span{0, 0, 1}, TkName{"x", Unique{3}}},
            Token{Span{0, 2, 12}, TkBuiltinFnId{"addInteger"}},
            Token{Span{0, 13, 20}, TkBuiltinTypeId{"integer"}},
            Token{Span{0, 21, 30}, TkConArgs{"string", syntax::LiteralConst::kDoubleQuotedChars, "\"hi\""}},
            Token{Span{0, 31, 34}, TkKeyword{syntax::Keyword::kLam}},
            Token{Span{0, 35, 37}, TkLiteralConst{syntax::LiteralConst::kEmptyBrackets, "()"}},
            Token{Span{0, 38, 40}, TkNatural{nat_("42")}},
            Token{Span{0, 40, 40}, TkEof{}},
        };
    }

    static bool test_every_variant_renders() {
        const auto toks = one_of_each_();
        const std::vector<std::string> expect = {
            "x", "addInteger", "integer", "string lit \"", "lam", "lit ()", "42", "",
        };

        bool ok = true;
        ok &= require_(toks.size() == std::variant_size_v<TokenData>, "fixture must cover every variant");
        for (size_t i = 0; i < toks.size(); ++i) {
            ok &= require_(toks[i].kind() == static_cast<TokenKind>(i), "fixture must follow TokenData order");
            const std::string got = render_token(toks[i]);
            if (got != expect[i]) {
                std::cerr << "  - " << token_kind_name(toks[i].kind()) << " rendered as [" << got
                          << "], expected [" << expect[i] << "]\n";
                ok = false;
            }
        }
        return ok;
    }

    static bool test_eof_renders_empty() {
        const Token eof{Span{7, 100, 100}, TkEof{}};
        const Token def{};

        bool ok = true;
        ok &= require_(render_token(eof).empty(), "EOF must render as empty");
        ok &= require_(def.is<TkEof>(), "default token is EOF");
        ok &= require_(render_token(def).empty(), "default token renders as empty");
        return ok;
    }

    static bool test_every_keyword_and_shape_renders() {
        bool ok = true;
        for (const auto kw : syntax::k_all_keywords) {
            const Token t{Span{}, TkKeyword{kw}};
            ok &= require_(render_token(t) == syntax::keyword_text(kw), "keyword token renders its spelling");
        }

        for (auto lit : {syntax::LiteralConst::kEmptyBrackets, syntax::LiteralConst::kSingleQuotedChars,
                         syntax::LiteralConst::kDoubleQuotedChars, syntax::LiteralConst::kUnQuotedChars}) {
            const Token t{Span{}, TkLiteralConst{lit, "body"}};
            ok &= require_(render_token(t) == syntax::literal_const_text(lit), "literal token renders its shape");

            const Token c{Span{}, TkConArgs{"ty", lit, "body"}};
            ok &= require_(render_token(c) == "ty " + std::string(syntax::literal_const_text(lit)),
                "con args render as '<type> <shape>'");
        }
        return ok;
    }

    static bool test_natural_renders_full_value() {
        const std::string big = "123456789012345678901234567890";
        const Token t{Span{}, TkNatural{nat_(big.c_str())}};
        return require_(render_token(t) == big, "natural renders every digit");
    }

    static bool test_render_tokens_skips_eof() {
        const auto toks = one_of_each_();
        const std::string got = render_tokens(toks);
        const std::string want = "x addInteger integer string lit \" lam lit () 42";

        bool ok = require_(got == want, "stream rendering must join with single spaces");
        if (!ok) std::cerr << "    got [" << got << "]\n";
        ok &= require_(render_tokens({}).empty(), "empty stream renders empty");
        return ok;
    }

    static bool test_dump_tokens_lists_kind_span_and_unique() {
        const std::vector<Token> toks = {
            Token{Span{0, 4, 5}, TkName{"y", Unique{9}}},
            Token{Span{0, 5, 5}, TkEof{}},
        };
        const std::string got = dump_tokens(toks);
        const std::string want = "name@4..5 y #9\neof@5..5\n";

        bool ok = require_(got == want, "dump format mismatch");
        if (!ok) std::cerr << "    got [" << got << "]\n";
        return ok;
    }

    static bool test_token_accessors() {
        const Token t{Span{1, 2, 3}, TkName{"abc", Unique{5}}};

        bool ok = true;
        ok &= require_(t.is<TkName>() && !t.is<TkEof>(), "is<> must follow the active variant");
        ok &= require_(t.as<TkName>().text == "abc", "as<> gives the payload");
        ok &= require_(t.as<TkName>().unique == Unique{5}, "name keeps its unique");
        ok &= require_(t.span == (Span{1, 2, 3}), "span is kept verbatim");
        ok &= require_(token_kind_name(t.kind()) == "name", "kind name");
        return ok;
    }

    static bool test_tokens_compare_by_span_then_payload() {
        const Token a{Span{0, 0, 1}, TkName{"x", Unique{3}}};
        const Token a2{Span{0, 0, 1}, TkName{"x", Unique{3}}};
        const Token moved{Span{0, 4, 5}, TkName{"x", Unique{3}}};
        const Token other_unique{Span{0, 0, 1}, TkName{"x", Unique{4}}};
        const Token kw{Span{0, 0, 1}, TkKeyword{syntax::Keyword::kLam}};

        bool ok = true;
        ok &= require_(a == a2, "equal span and payload compare equal");
        ok &= require_(!(a < a2) && !(a2 < a), "equal tokens are not ordered");
        ok &= require_(a != moved, "different span compares unequal");
        ok &= require_(a < moved, "span orders first");
        ok &= require_(a != other_unique, "different unique compares unequal");
        ok &= require_(a < other_unique, "same text orders by unique");
        ok &= require_(a != kw, "different variants compare unequal");
        ok &= require_(a < kw && !(kw < a), "name orders before keyword");
        ok &= require_(Token{} == Token{}, "default tokens compare equal");

        const Token big{Span{}, TkNatural{nat_("100000000000000000000")}};
        const Token small{Span{}, TkNatural{nat_("99")}};
        ok &= require_(small < big && !(big < small), "naturals order by value");

        const Token lit_a{Span{}, TkLiteralConst{syntax::LiteralConst::kEmptyBrackets, "()"}};
        const Token lit_b{Span{}, TkLiteralConst{syntax::LiteralConst::kUnQuotedChars, "()"}};
        ok &= require_(lit_a != lit_b && lit_a < lit_b, "literal shape takes part in ordering");
        return ok;
    }

    static bool test_same_span_orders_by_variant() {
        // with a shared span, ordering falls back to TokenData alternative order
        auto toks = one_of_each_();
        for (auto& t : toks) t.span = Span{2, 5, 6};

        bool ok = true;
        for (size_t i = 0; i + 1 < toks.size(); ++i) {
            ok &= require_(toks[i] < toks[i + 1], "earlier variant orders first");
            ok &= require_(!(toks[i + 1] < toks[i]), "later variant never orders first");
        }

        const std::set<Token> uniq(toks.begin(), toks.end());
        ok &= require_(uniq.size() == toks.size(), "tokens usable as ordered set keys");

        std::vector<Token> twice = toks;
        twice.insert(twice.end(), toks.begin(), toks.end());
        const std::set<Token> dedup(twice.begin(), twice.end());
        ok &= require_(dedup.size() == toks.size(), "duplicates collapse in ordered set");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"every_variant_renders", test_every_variant_renders},
        {"eof_renders_empty", test_eof_renders_empty},
        {"every_keyword_and_shape_renders", test_every_keyword_and_shape_renders},
        {"natural_renders_full_value", test_natural_renders_full_value},
        {"render_tokens_skips_eof", test_render_tokens_skips_eof},
        {"dump_tokens_lists_kind_span_and_unique", test_dump_tokens_lists_kind_span_and_unique},
        {"token_accessors", test_token_accessors},
        {"tokens_compare_by_span_then_payload", test_tokens_compare_by_span_then_payload},
        {"same_span_orders_by_variant", test_same_span_orders_by_variant},
    };

    int failed = 0;
    for (const auto& tc : cases) {
        std::cout << "[TEST] " << tc.name << "\n";
        const bool ok = tc.def();
        if (!ok) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "FAILED: " << failed << " test(s)\n";
        return 1;
    }

    std::cout << "ALL TESTS PASSED\n";
    return 0;
}
