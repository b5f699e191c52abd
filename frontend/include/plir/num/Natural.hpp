// frontend/include/plir/num/Natural.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace plir::num {

    // Arbitrary-precision non-negative integer carried by Natural tokens.
    // - Base 1e9 limbs (little-endian), no trailing zero limbs
    // - zero is the empty limb vector
    class Natural {
    public:
        Natural() = default;

        static Natural zero() { return Natural(); }
        static Natural from_u64(uint64_t v);

        // Parse decimal: [0-9]+
        // Returns false if invalid text (empty, sign, separators, non-digit).
        static bool parse_dec(std::string_view text, Natural& out);

        bool is_zero() const { return limbs_.empty(); }

        // Compare: -1,0,1
        int compare(const Natural& rhs) const;

        bool fits_u64() const;
        // precondition: fits_u64()
        uint64_t to_u64() const;

        // full decimal spelling, never truncated
        std::string to_string() const;

        friend bool operator==(const Natural& a, const Natural& b) { return a.limbs_ == b.limbs_; }
        friend bool operator!=(const Natural& a, const Natural& b) { return !(a == b); }
        friend bool operator<(const Natural& a, const Natural& b)  { return a.compare(b) < 0; }

    private:
        void normalize_();

        // multiply by small and add small
        void mul_add_(uint32_t mul, uint32_t add);

        std::vector<uint32_t> limbs_; // base 1e9
    };

} // namespace plir::num
