// frontend/src/num/natural.cpp
#include <plir/num/Natural.hpp>


namespace plir::num {

    static constexpr uint32_t kBase = 1000000000u; // 1e9

    void Natural::normalize_() {
        while (!limbs_.empty() && limbs_.back() == 0) limbs_.pop_back();
    }

    void Natural::mul_add_(uint32_t mul, uint32_t add) {
        uint64_t carry = add;
        for (size_t i = 0; i < limbs_.size(); ++i) {
            uint64_t x = (uint64_t)limbs_[i] * mul + carry;
            limbs_[i] = (uint32_t)(x % kBase);
            carry = x / kBase;
        }
        while (carry) {
            limbs_.push_back((uint32_t)(carry % kBase));
            carry /= kBase;
        }
    }

    Natural Natural::from_u64(uint64_t v) {
        Natural out;
        while (v) {
            out.limbs_.push_back((uint32_t)(v % kBase));
            v /= kBase;
        }
        return out;
    }

    bool Natural::parse_dec(std::string_view text, Natural& out) {
        out = Natural{};
        if (text.empty()) return false;

        for (char c : text) {
            if (c < '0' || c > '9') {
                out = Natural{};
                return false;
            }
            out.mul_add_(10, (uint32_t)(c - '0'));
        }

        out.normalize_();
        return true;
    }

    int Natural::compare(const Natural& rhs) const {
        if (limbs_.size() < rhs.limbs_.size()) return -1;
        if (limbs_.size() > rhs.limbs_.size()) return 1;
        for (size_t i = limbs_.size(); i-- > 0;) {
            if (limbs_[i] < rhs.limbs_[i]) return -1;
            if (limbs_[i] > rhs.limbs_[i]) return 1;
        }
        return 0;
    }

    bool Natural::fits_u64() const {
        // 2^64 - 1 = 18 446744073 709551615 (3 limbs)
        static const Natural u64_max = from_u64(UINT64_MAX);
        return compare(u64_max) <= 0;
    }

    uint64_t Natural::to_u64() const {
        uint64_t v = 0;
        for (size_t i = limbs_.size(); i-- > 0;) {
            v = v * kBase + limbs_[i];
        }
        return v;
    }

    std::string Natural::to_string() const {
        if (is_zero()) return "0";

        // most significant limb without padding, the rest padded to 9 digits
        std::string s = std::to_string(limbs_.back());
        for (size_t i = limbs_.size() - 1; i-- > 0;) {
            const std::string part = std::to_string(limbs_[i]);
            s.append(9 - part.size(), '0');
            s += part;
        }
        return s;
    }

} // namespace plir::num
