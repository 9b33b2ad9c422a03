#include "regex.hpp"

#include <array>
#include <cstdint>

#include <fmt/format.h>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

namespace tether::http {

namespace {

std::string describe_error(int error_code) {
    std::array<PCRE2_UCHAR, 256> message{};
    int length = pcre2_get_error_message(error_code, message.data(), message.size());
    if (length < 0) {
        return fmt::format("PCRE2 error {}", error_code);
    }
    return std::string(reinterpret_cast<const char*>(message.data()),
                       static_cast<size_t>(length));
}

struct MatchDataDeleter {
    void operator()(pcre2_match_data* data) const noexcept { pcre2_match_data_free(data); }
};

}  // namespace

Regex::Regex(std::shared_ptr<pcre2_real_code_8> code, std::string source, bool jit)
    : code_(std::move(code)), source_(std::move(source)), jit_(jit) {}

std::optional<Regex> Regex::compile(std::string_view source, RegexOptions options,
                                    std::string& error) {
    uint32_t flags = 0;
    if (options.case_insensitive) {
        flags |= PCRE2_CASELESS;
    }
    if (options.anchored) {
        flags |= PCRE2_ANCHORED | PCRE2_ENDANCHORED;
    }

    int error_code = 0;
    PCRE2_SIZE error_offset = 0;
    pcre2_code* raw = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(source.data()), source.size(),
                                    flags, &error_code, &error_offset, nullptr);
    if (raw == nullptr) {
        error = fmt::format("{} (offset {} of '{}')", describe_error(error_code), error_offset,
                            source);
        return std::nullopt;
    }

    std::shared_ptr<pcre2_real_code_8> code(raw, [](pcre2_code* c) { pcre2_code_free(c); });

    // Interpreter fallback when the JIT is unavailable
    bool jit = pcre2_jit_compile(raw, PCRE2_JIT_COMPLETE) == 0;

    return Regex(std::move(code), std::string(source), jit);
}

bool Regex::matches(std::string_view subject) const {
    std::unique_ptr<pcre2_match_data, MatchDataDeleter> data(
        pcre2_match_data_create_from_pattern(code_.get(), nullptr));
    if (!data) {
        return false;
    }

    int rc = pcre2_match(code_.get(), reinterpret_cast<PCRE2_SPTR>(subject.data()),
                         subject.size(), 0, 0, data.get(), nullptr);
    return rc >= 0;
}

std::string regex_escape(std::string_view literal) {
    static constexpr std::string_view kMeta = R"(\^$.|?*+()[]{}/-)";
    std::string out;
    out.reserve(literal.size() * 2);
    for (char c : literal) {
        if (kMeta.find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

}  // namespace tether::http
