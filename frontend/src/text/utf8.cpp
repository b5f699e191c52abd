// frontend/src/text/utf8.cpp
#include <plir/text/Utf8.hpp>


namespace plir::text {

    namespace {
        bool is_cont_(unsigned char b) {
            return (b & 0xC0) == 0x80;
        }
    } // namespace

    bool utf8_decode_strict(std::string_view s, size_t& i, uint32_t& cp) {
        if (i >= s.size()) return false;
        const unsigned char b0 = static_cast<unsigned char>(s[i]);

        // ASCII
        if (b0 < 0x80) {
            cp = b0;
            i += 1;
            return true;
        }

        size_t need = 0;
        uint32_t acc = 0;
        if (b0 >= 0xC2 && b0 <= 0xDF)      { need = 1; acc = b0 & 0x1Fu; }
        else if (b0 >= 0xE0 && b0 <= 0xEF) { need = 2; acc = b0 & 0x0Fu; }
        else if (b0 >= 0xF0 && b0 <= 0xF4) { need = 3; acc = b0 & 0x07u; }
        else return false; // continuation byte or C0/C1/F5..FF lead

        if (i + need >= s.size()) return false; // truncated

        const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);

        // reject overlong / surrogate / out of range by the second byte
        if (b0 == 0xE0 && b1 < 0xA0) return false;
        if (b0 == 0xED && b1 >= 0xA0) return false;
        if (b0 == 0xF0 && b1 < 0x90) return false;
        if (b0 == 0xF4 && b1 > 0x8F) return false;

        for (size_t k = 1; k <= need; ++k) {
            const unsigned char b = static_cast<unsigned char>(s[i + k]);
            if (!is_cont_(b)) return false;
            acc = (acc << 6) | (b & 0x3Fu);
        }

        cp = acc;
        i += need + 1;
        return true;
    }

    bool validate_utf8_strict(std::string_view s, uint32_t& bad_off) {
        size_t i = 0;
        while (i < s.size()) {
            uint32_t cp = 0;
            if (!utf8_decode_strict(s, i, cp)) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
        }
        return true;
    }

} // namespace plir::text
