// frontend/include/plir/diag/Diagnostic.hpp
#pragma once
#include <plir/text/Span.hpp>
#include <plir/diag/DiagCode.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace plir::diag {

    // One report from a lexing session. Args fill the message template's {0}, {1}, ...
    class Diagnostic {
    public:
        Diagnostic(Severity severity, Code code, Span span)
            : severity_(severity), code_(code), span_(span) {}

        void add_arg(std::string_view s) { args_.emplace_back(s); }
        void add_arg_u64(uint64_t v)    { args_.push_back(std::to_string(v)); }

        Severity severity() const { return severity_; }
        Code code() const { return code_; }
        Span span() const { return span_; }
        const std::vector<std::string>& args() const { return args_; }

        bool is_fatal() const { return severity_ == Severity::kFatal; }

    private:
        Severity severity_;
        Code code_;
        Span span_;
        std::vector<std::string> args_;
    };

    // 세션 하나가 쌓는 진단 목록. severity별 개수를 같이 센다.
    class Bag {
    public:
        void add(Diagnostic d) {
            ++counts_[static_cast<size_t>(d.severity())];
            diags_.push_back(std::move(d));
        }

        uint32_t count(Severity s) const { return counts_[static_cast<size_t>(s)]; }

        uint32_t error_count() const { return count(Severity::kError); }
        uint32_t fatal_count() const { return count(Severity::kFatal); }

        // errors or fatals; warnings alone do not count
        bool has_error() const { return error_count() != 0 || fatal_count() != 0; }
        bool has_fatal() const { return fatal_count() != 0; }

        // first diagnostic carrying `c`, nullptr if none
        const Diagnostic* find(Code c) const {
            for (const auto& d : diags_) {
                if (d.code() == c) return &d;
            }
            return nullptr;
        }

        bool has_code(Code c) const { return find(c) != nullptr; }

        const std::vector<Diagnostic>& diags() const { return diags_; }

    private:
        std::vector<Diagnostic> diags_;
        std::array<uint32_t, static_cast<size_t>(Severity::kFatal) + 1> counts_{}; // indexed by Severity
    };

} // namespace plir::diag
