// frontend/src/lex/lex_session.cpp
#include <plir/lex/LexSession.hpp>
#include <plir/text/Utf8.hpp>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>


namespace plir {

    namespace {
        std::string byte_hex2_(unsigned char b) {
            static constexpr char kHex[] = "0123456789ABCDEF";
            std::string s;
            s.push_back(kHex[(b >> 4) & 0xF]);
            s.push_back(kHex[b & 0xF]);
            return s;
        }
    } // namespace

    LexSession::LexSession(LexOptions opt, diag::Bag* diags)
        : idents_(IdentifierState::from(opt.first_unique)),
          max_errors_(opt.max_errors),
          diags_(diags) {}

    void LexSession::report_(diag::Code code, Span sp, std::string_view a0) {
        diag::Diagnostic d(diag::Severity::kError, code, sp);
        d.add_arg(a0);
        report_(std::move(d));
    }

    void LexSession::report_(diag::Diagnostic d) {
        if (aborted_) return;

        const Span sp = d.span();
        ++error_count_;
        if (diags_) diags_->add(std::move(d));

        // -fmax-errors= 제한
        if (max_errors_ != 0 && error_count_ >= max_errors_) {
            report_fatal_(diag::Code::kTooManyErrors, sp);
        }
    }

    void LexSession::report_fatal_(diag::Code code, Span sp, std::string_view a0) {
        if (aborted_) return;

        if (diags_) {
            diag::Diagnostic d(diag::Severity::kFatal, code, sp);
            d.add_arg(a0);
            diags_->add(std::move(d));
        }
        aborted_ = true;
    }

    bool LexSession::check_utf8_(Span sp, std::string_view text) {
        uint32_t bad_off = 0;
        if (text::validate_utf8_strict(text, bad_off)) return true;

        // offset 범위 끝에 걸친 span은 wrap 없이 끝에 고정
        const uint32_t room = std::numeric_limits<uint32_t>::max() - sp.lo;
        const uint32_t lo = sp.lo + std::min(bad_off, room);
        const uint32_t hi = (lo == std::numeric_limits<uint32_t>::max()) ? lo : lo + 1;

        diag::Diagnostic d(diag::Severity::kError, diag::Code::kInvalidUtf8, Span{sp.file_id, lo, hi});
        d.add_arg_u64(lo);
        d.add_arg(byte_hex2_(static_cast<unsigned char>(text[bad_off])));
        report_(std::move(d));
        return false;
    }

    std::optional<Token> LexSession::name(Span sp, std::string_view text) {
        if (aborted_) return std::nullopt;

        if (text.empty()) {
            report_(diag::Code::kEmptyIdentifier, sp);
            return std::nullopt;
        }
        if (!check_utf8_(sp, text)) return std::nullopt;

        const auto u = idents_.intern(text);
        if (!u) {
            report_fatal_(diag::Code::kIdentifierHandleExhausted, sp, text);
            return std::nullopt;
        }

        return Token{sp, TkName{std::string(text), *u}};
    }

    std::optional<Token> LexSession::word(Span sp, std::string_view text) {
        if (aborted_) return std::nullopt;

        if (const auto kw = syntax::keyword_from_text(text)) {
            return Token{sp, TkKeyword{*kw}};
        }
        return name(sp, text);
    }

    std::optional<Token> LexSession::builtin_function(Span sp, std::string_view text) {
        if (aborted_) return std::nullopt;

        if (text.empty()) {
            report_(diag::Code::kEmptyIdentifier, sp);
            return std::nullopt;
        }
        if (!check_utf8_(sp, text)) return std::nullopt;

        return Token{sp, TkBuiltinFnId{std::string(text)}};
    }

    std::optional<Token> LexSession::builtin_type(Span sp, std::string_view text) {
        if (aborted_) return std::nullopt;

        if (text.empty()) {
            report_(diag::Code::kEmptyIdentifier, sp);
            return std::nullopt;
        }
        if (!check_utf8_(sp, text)) return std::nullopt;

        return Token{sp, TkBuiltinTypeId{std::string(text)}};
    }

    std::optional<Token> LexSession::natural(Span sp, std::string_view digits) {
        if (aborted_) return std::nullopt;

        num::Natural n;
        if (!num::Natural::parse_dec(digits, n)) {
            report_(diag::Code::kInvalidNatural, sp, digits);
            return std::nullopt;
        }

        return Token{sp, TkNatural{std::move(n)}};
    }

    std::optional<syntax::LiteralConst> LexSession::classify_(Span sp, std::string_view body) {
        const auto lit = syntax::classify_literal_body(body);
        if (!lit) report_(diag::Code::kMalformedLiteralConst, sp, body);
        return lit;
    }

    std::optional<Token> LexSession::literal(Span sp, std::string_view body) {
        if (aborted_) return std::nullopt;

        const auto lit = classify_(sp, body);
        if (!lit) return std::nullopt;

        return Token{sp, TkLiteralConst{*lit, std::string(syntax::trim_literal_body(body))}};
    }

    std::optional<Token> LexSession::con_args(Span sp, std::string_view type_name, std::string_view body) {
        if (aborted_) return std::nullopt;

        if (type_name.empty()) {
            report_(diag::Code::kEmptyIdentifier, sp);
            return std::nullopt;
        }
        if (!check_utf8_(sp, type_name)) return std::nullopt;

        const auto lit = classify_(sp, body);
        if (!lit) return std::nullopt;

        return Token{sp, TkConArgs{std::string(type_name), *lit, std::string(syntax::trim_literal_body(body))}};
    }

    Token LexSession::end_of_input(Span sp) const {
        return Token{sp, TkEof{}};
    }

} // namespace plir
