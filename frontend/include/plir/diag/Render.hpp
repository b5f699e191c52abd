// frontend/include/plir/diag/Render.hpp
#pragma once
#include <plir/diag/Diagnostic.hpp>
#include <plir/text/SourceManager.hpp>

#include <string>


namespace plir::diag {

    std::string code_name(Code c);

    // message only, args substituted
    std::string render_message(const Diagnostic& d, Language lang);

    /// @brief "error[Code]: msg" + 위치 + 캐럿 스니펫까지 렌더링
    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm);

} // namespace plir::diag
