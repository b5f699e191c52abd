// frontend/include/plir/lex/LexOptions.hpp
#pragma once
#include <plir/lex/Unique.hpp>

#include <cstdint>


namespace plir {

    struct LexOptions {
        // first handle the session allocates. 0 == a fresh session;
        // anything else continues from a previous session's next().
        Unique first_unique{0};

        // -fmax-errors= equivalent. 0 means no limit.
        uint32_t max_errors = 64;
    };

} // namespace plir
