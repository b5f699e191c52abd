// frontend/src/lex/identifier_state.cpp
#include <plir/lex/IdentifierState.hpp>


namespace plir {

    std::optional<Unique> IdentifierState::intern(std::string_view text) {
        auto it = table_.find(text);
        if (it != table_.end()) return it->second;

        // next_ + 1 must stay representable (mapped < next); never wrap
        if (exhausted()) return std::nullopt;

        const Unique u = next_;
        table_.emplace(std::string(text), u);
        next_ = Unique{u.value() + 1};
        return u;
    }

    std::optional<Unique> IdentifierState::lookup(std::string_view text) const {
        auto it = table_.find(text);
        if (it == table_.end()) return std::nullopt;
        return it->second;
    }

} // namespace plir
