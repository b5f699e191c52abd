// frontend/include/plir/lex/IdentifierState.hpp
#pragma once
#include <plir/lex/Unique.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>


namespace plir {

    // transparent hash so lookups by string_view do not allocate
    struct SvHash {
        using is_transparent = void;

        size_t operator()(std::string_view s) const noexcept {
            // FNV-1a
            size_t h = 1469598103934665603ull;
            for (unsigned char c : s) {
                h ^= (size_t)c;
                h *= 1099511628211ull;
            }
            return h;
        }
    };

    struct SvEq {
        using is_transparent = void;

        bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    /// @brief 식별자 텍스트 -> Unique 인터닝 테이블 (한 lexing 세션 전용).
    ///
    /// Flat, unscoped: equal spellings anywhere in the session get the same
    /// handle. Handles are allocated densely from the start value in
    /// first-seen order.
    ///
    /// Invariants:
    /// - every mapped handle is < next()
    /// - text -> handle is injective within the session
    /// - next() never decreases
    ///
    /// Not thread-safe. One scanner owns one state for one session.
    class IdentifierState {
    public:
        // fresh session: empty table, next = 0
        static IdentifierState empty() { return IdentifierState(Unique{0}); }

        // Continue allocation at `start`, e.g. to keep handles of a second
        // program disjoint from a first one. The caller picks a start above
        // every handle that must stay distinct; this is not checked.
        static IdentifierState from(Unique start) { return IdentifierState(start); }

        // Known text: returns its handle, state unchanged.
        // New text: returns next(), records it, bumps next().
        // nullopt only on handle exhaustion; the state is left untouched then.
        std::optional<Unique> intern(std::string_view text);

        // read-only lookup, never allocates
        std::optional<Unique> lookup(std::string_view text) const;

        Unique next() const { return next_; }
        size_t size() const { return table_.size(); }
        bool is_empty() const { return table_.empty(); }

        // next() + 1 is not representable, so no new text can be interned
        bool exhausted() const { return next_.value() == Unique::kMax; }

    private:
        explicit IdentifierState(Unique start) : next_(start) {}

        std::unordered_map<std::string, Unique, SvHash, SvEq> table_;
        Unique next_{};
    };

} // namespace plir
