// frontend/include/plir/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace plir::diag {

    enum class Severity : uint8_t {
        kError,
        kWarning,
        kFatal,     // compiler-internal limit, ends the session
    };

    enum class Language : uint8_t {
        kEn,
        kKo,
    };

    enum class Code : uint16_t {
        kInvalidUtf8,                 // 올바른 UTF8 문자열이 아님
        kEmptyIdentifier,             // identifier lexeme with no text
        kInvalidNatural,              // natural lexeme is not [0-9]+
        kMalformedLiteralConst,       // literal body matches none of the four shapes
        kTooManyErrors,

        // internal limits
        kIdentifierHandleExhausted,   // no Unique left to allocate
    };

} // namespace plir::diag
