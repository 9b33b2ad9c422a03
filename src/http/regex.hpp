#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

// pcre2_code without pulling in pcre2.h
struct pcre2_real_code_8;

namespace tether::http {

struct RegexOptions {
    bool case_insensitive = false;
    bool anchored = false;  // Whole subject must match
};

// Compiled PCRE2 expression; copies share the code, matching is const and thread-safe
class Regex {
public:
    // nullopt on a syntax error, described in `error`
    [[nodiscard]] static std::optional<Regex> compile(std::string_view source,
                                                      RegexOptions options, std::string& error);

    [[nodiscard]] bool matches(std::string_view subject) const;

    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    [[nodiscard]] bool jit_compiled() const noexcept { return jit_; }

private:
    Regex(std::shared_ptr<pcre2_real_code_8> code, std::string source, bool jit);

    std::shared_ptr<pcre2_real_code_8> code_;
    std::string source_;
    bool jit_;
};

/// Escape regex metacharacters so `literal` matches itself
[[nodiscard]] std::string regex_escape(std::string_view literal);

}  // namespace tether::http
