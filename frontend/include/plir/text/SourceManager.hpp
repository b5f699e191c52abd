// frontend/include/plir/text/SourceManager.hpp
#pragma once
#include <plir/text/Span.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace plir {

    // 진단 출력용 한 줄 스니펫. column 값은 모두 화면 칸 기준.
    struct Snippet {
        std::string_view line_text{};
        uint32_t line_no = 1;           // 1-based
        uint32_t col = 1;               // 1-based
        uint32_t caret_cols_before = 0;
        uint32_t caret_cols_len = 1;
    };

    // Owns source buffers so diagnostics can point back into them.
    // Spans are opaque everywhere else; only rendering resolves them here.
    class SourceManager {
    public:
        uint32_t add(std::string name, std::string content);

        bool has_file(uint32_t file_id) const { return file_id < files_.size(); }

        // "" for an unknown file_id
        std::string_view name(uint32_t file_id) const;

        // nullopt when the span names no registered buffer
        std::optional<Snippet> snippet_for_span(const Span& sp) const;

    private:
        struct File {
            std::string name;
            std::string content;
            std::vector<uint32_t> line_starts; // byte offset of every line, first is 0
        };

        std::vector<File> files_;
    };

} // namespace plir
