// frontend/src/text/source_manager.cpp
#include <plir/text/SourceManager.hpp>
#include <plir/text/Utf8.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>


namespace plir {

    namespace {
        struct CpRange {
            uint32_t lo;
            uint32_t hi;
        };

        // combining marks take no column
        constexpr CpRange kZeroWidth[] = {
            {0x0300, 0x036F}, {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF},
            {0x20D0, 0x20FF}, {0xFE20, 0xFE2F},
        };

        // 한글 / CJK / fullwidth: two columns
        constexpr CpRange kWide[] = {
            {0x1100, 0x115F}, {0x2E80, 0xA4CF}, {0xAC00, 0xD7A3},
            {0xF900, 0xFAFF}, {0xFE30, 0xFE6F}, {0xFF00, 0xFF60},
            {0xFFE0, 0xFFE6},
        };

        template <size_t N>
        bool in_ranges_(const CpRange (&rs)[N], uint32_t cp) {
            return std::any_of(std::begin(rs), std::end(rs),
                [cp](const CpRange& r) { return cp >= r.lo && cp <= r.hi; });
        }

        uint32_t cp_columns_(uint32_t cp) {
            if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return 0;
            if (in_ranges_(kZeroWidth, cp)) return 0;
            if (in_ranges_(kWide, cp)) return 2;
            return 1;
        }

        // columns taken by s; a broken byte counts as one column (U+FFFD)
        uint32_t columns_(std::string_view s) {
            uint32_t w = 0;
            size_t i = 0;
            while (i < s.size()) {
                uint32_t cp = 0;
                if (text::utf8_decode_strict(s, i, cp)) {
                    w += cp_columns_(cp);
                } else {
                    ++i;
                    ++w;
                }
            }
            return w;
        }
    } // namespace

    uint32_t SourceManager::add(std::string name, std::string content) {
        File f;
        f.name = std::move(name);
        f.content = std::move(content);
        f.line_starts.push_back(0);
        for (uint32_t i = 0; i < f.content.size(); ++i) {
            if (f.content[i] == '\n') f.line_starts.push_back(i + 1);
        }

        files_.push_back(std::move(f));
        return static_cast<uint32_t>(files_.size() - 1);
    }

    std::string_view SourceManager::name(uint32_t file_id) const {
        if (!has_file(file_id)) return {};
        return files_[file_id].name;
    }

    std::optional<Snippet> SourceManager::snippet_for_span(const Span& sp) const {
        if (!has_file(sp.file_id)) return std::nullopt;

        const File& f = files_[sp.file_id];
        const std::string_view src = f.content;
        const uint32_t size = static_cast<uint32_t>(src.size());

        const uint32_t lo = std::min(sp.lo, size);
        const uint32_t hi = std::max(lo, std::min(sp.hi, size));

        const auto it = std::upper_bound(f.line_starts.begin(), f.line_starts.end(), lo);
        const size_t idx = static_cast<size_t>(std::distance(f.line_starts.begin(), it)) - 1;
        const uint32_t line_lo = f.line_starts[idx];
        const uint32_t line_hi = (idx + 1 < f.line_starts.size()) ? f.line_starts[idx + 1] - 1 : size;

        Snippet sn;
        sn.line_text = src.substr(line_lo, line_hi - line_lo);
        sn.line_no = static_cast<uint32_t>(idx) + 1;
        sn.caret_cols_before = columns_(src.substr(line_lo, lo - line_lo));
        sn.col = sn.caret_cols_before + 1;

        // carets stay on the first line of the span
        const uint32_t caret_hi = std::min(hi, line_hi);
        sn.caret_cols_len = std::max<uint32_t>(1, columns_(src.substr(lo, caret_hi - lo)));
        return sn;
    }

} // namespace plir
