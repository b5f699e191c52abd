// frontend/src/diag/render.cpp
#include <plir/diag/Render.hpp>

#include <sstream>


namespace plir::diag {

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }

        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    static std::string_view code_name_sv_(Code c) {
        switch (c) {
            case Code::kInvalidUtf8: return "InvalidUtf8";
            case Code::kEmptyIdentifier: return "EmptyIdentifier";
            case Code::kInvalidNatural: return "InvalidNatural";
            case Code::kMalformedLiteralConst: return "MalformedLiteralConst";
            case Code::kTooManyErrors: return "TooManyErrors";
            case Code::kIdentifierHandleExhausted: return "IdentifierHandleExhausted";
        }

        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            // args: {0}=byte offset, {1}=byte hex
            case Code::kInvalidUtf8: return "invalid UTF-8 sequence starting at byte offset {0} (byte=0x{1})";
            case Code::kEmptyIdentifier: return "identifier must not be empty";
            // args: {0}=lexeme
            case Code::kInvalidNatural: return "'{0}' is not a natural number";
            // args: {0}=body
            case Code::kMalformedLiteralConst: return "malformed literal constant '{0}'; expected (), '...', \"...\" or an unquoted run without parentheses";
            case Code::kTooManyErrors: return "too many errors emitted; lexing stopped";
            // args: {0}=identifier
            case Code::kIdentifierHandleExhausted: return "internal limit: no identifier handle left for '{0}'";
        }

        return "unknown diagnostic";
    }

    static std::string template_ko(Code c) {
        switch (c) {
            case Code::kInvalidUtf8: return "UTF-8 시퀀스가 바이트 오프셋 {0}에서 깨졌습니다 (바이트=0x{1})";
            case Code::kEmptyIdentifier: return "식별자는 비어 있을 수 없습니다";
            case Code::kInvalidNatural: return "'{0}'은(는) 자연수가 아닙니다";
            case Code::kMalformedLiteralConst: return "잘못된 리터럴 상수 '{0}'; (), '...', \"...\" 또는 괄호 없는 문자열이 필요합니다";
            case Code::kTooManyErrors: return "오류가 너무 많아 lexing을 중단했습니다";
            case Code::kIdentifierHandleExhausted: return "내부 한계: '{0}'에 할당할 식별자 핸들이 남아 있지 않습니다";
        }

        return "알 수 없는 진단";
    }

    std::string code_name(Code c) {
        return std::string(code_name_sv_(c));
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string msg = (lang == Language::kKo) ? template_ko(d.code()) : template_en(d.code());
        return format_template(std::move(msg), d.args());
    }

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm) {
        std::string msg = render_message(d, lang);

        std::ostringstream oss;
        auto sev = d.severity();
        const char* sev_name =
            (sev == Severity::kWarning) ? "warning" :
            (sev == Severity::kFatal)   ? "fatal"   : "error";

        oss << sev_name << "[" << code_name_sv_(d.code()) << "]: " << msg;

        // span이 등록되지 않은 버퍼를 가리키면 위치/스니펫 없이 헤더만 출력
        const auto sp = d.span();
        const auto sn = sm.snippet_for_span(sp);
        if (!sn) return oss.str();

        oss << "\n";
        oss << " --> " << sm.name(sp.file_id) << ":" << sn->line_no << ":" << sn->col << "\n";
        oss << "  |\n";
        oss << sn->line_no << " | " << sn->line_text << "\n";
        oss << "  | ";

        for (uint32_t i = 0; i < sn->caret_cols_before; ++i) oss << ' ';
        for (uint32_t i = 0; i < sn->caret_cols_len; ++i) oss << '^';

        return oss.str();
    }

} // namespace plir::diag
