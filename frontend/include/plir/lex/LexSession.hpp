// frontend/include/plir/lex/LexSession.hpp
#pragma once
#include <plir/diag/Diagnostic.hpp>
#include <plir/lex/IdentifierState.hpp>
#include <plir/lex/LexOptions.hpp>
#include <plir/lex/Token.hpp>

#include <optional>
#include <string_view>


namespace plir {

    /// @brief 스캐너가 잘라낸 lexeme을 Token으로 감싸는 세션 경계.
    ///
    /// The character-level scanner owns slicing and classification of the
    /// source; for each lexeme it calls exactly one entry point here, in
    /// source order. Identifier-shaped lexemes go through the session's
    /// IdentifierState. Everything else is wrapped without touching it.
    ///
    /// Entry points return nullopt when the lexeme is rejected; the reason is
    /// reported into the Bag (if any). After a fatal diagnostic the session is
    /// aborted and every entry point returns nullopt.
    ///
    /// One session per scan, one thread.
    class LexSession {
    public:
        explicit LexSession(LexOptions opt = {})
            : LexSession(opt, nullptr) {}

        LexSession(LexOptions opt, diag::Bag* diags);

        // identifier: interned, never matched against keywords
        std::optional<Token> name(Span sp, std::string_view text);

        // identifier-or-keyword: keyword table first, then name()
        std::optional<Token> word(Span sp, std::string_view text);

        std::optional<Token> builtin_function(Span sp, std::string_view text);
        std::optional<Token> builtin_type(Span sp, std::string_view text);

        // digits only; value is unbounded
        std::optional<Token> natural(Span sp, std::string_view digits);

        // raw literal body, classified by shape only
        std::optional<Token> literal(Span sp, std::string_view body);

        // `con` arguments: type name plus the raw body that follows it
        std::optional<Token> con_args(Span sp, std::string_view type_name, std::string_view body);

        Token end_of_input(Span sp) const;

        const IdentifierState& identifiers() const { return idents_; }

        bool aborted() const { return aborted_; }
        uint32_t error_count() const { return error_count_; }

    private:
        bool check_utf8_(Span sp, std::string_view text);
        std::optional<syntax::LiteralConst> classify_(Span sp, std::string_view body);

        void report_(diag::Code code, Span sp, std::string_view a0 = {});
        void report_(diag::Diagnostic d);
        void report_fatal_(diag::Code code, Span sp, std::string_view a0 = {});

        IdentifierState idents_;
        uint32_t max_errors_ = 0;

        diag::Bag* diags_ = nullptr;
        uint32_t error_count_ = 0;
        bool aborted_ = false;
    };

} // namespace plir
