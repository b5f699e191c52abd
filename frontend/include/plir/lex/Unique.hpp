// frontend/include/plir/lex/Unique.hpp
#pragma once
#include <cstdint>
#include <limits>


namespace plir {

    // Handle of one distinct identifier spelling within an interning session.
    // Only equality/ordering are exposed so it never mixes with Natural payloads
    // or other integers.
    class Unique {
    public:
        using Rep = uint64_t;

        static constexpr Rep kMax = std::numeric_limits<Rep>::max();

        constexpr Unique() = default;
        constexpr explicit Unique(Rep v) : value_(v) {}

        constexpr Rep value() const { return value_; }

        friend constexpr bool operator==(Unique a, Unique b) { return a.value_ == b.value_; }
        friend constexpr bool operator!=(Unique a, Unique b) { return a.value_ != b.value_; }
        friend constexpr bool operator<(Unique a, Unique b)  { return a.value_ < b.value_; }
        friend constexpr bool operator<=(Unique a, Unique b) { return a.value_ <= b.value_; }
        friend constexpr bool operator>(Unique a, Unique b)  { return a.value_ > b.value_; }
        friend constexpr bool operator>=(Unique a, Unique b) { return a.value_ >= b.value_; }

    private:
        Rep value_ = 0;
    };

} // namespace plir
