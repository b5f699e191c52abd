// frontend/include/plir/text/Utf8.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>


namespace plir::text {

    // Strict decode of one code point at s[i].
    // On success advances i past the sequence and stores the code point.
    // On failure leaves i untouched (overlong, surrogate, > U+10FFFF, truncated).
    bool utf8_decode_strict(std::string_view s, size_t& i, uint32_t& cp);

    // Strict UTF-8 validator.
    // Returns false and sets bad_off when an invalid byte sequence is found.
    bool validate_utf8_strict(std::string_view s, uint32_t& bad_off);

} // namespace plir::text
