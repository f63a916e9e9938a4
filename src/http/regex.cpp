#include "regex.hpp"

#include <cstdint>
#include <string_view>

// PCRE2 API - use 8-bit code units
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

namespace conduit::http {

static std::string get_pcre2_error(int error_code) {
    PCRE2_UCHAR buffer[256];
    pcre2_get_error_message(error_code, buffer, sizeof(buffer));
    return std::string(reinterpret_cast<const char*>(buffer));
}

Regex::Regex(pcre2_real_code_8* code, std::string pattern)
    : code_(code), pattern_(std::move(pattern)) {}

Regex::Regex(Regex&& other) noexcept : code_(other.code_), pattern_(std::move(other.pattern_)) {
    other.code_ = nullptr;
}

Regex& Regex::operator=(Regex&& other) noexcept {
    if (this != &other) {
        if (code_) {
            pcre2_code_free(code_);
        }
        code_ = other.code_;
        pattern_ = std::move(other.pattern_);
        other.code_ = nullptr;
    }
    return *this;
}

Regex::~Regex() {
    if (code_) {
        pcre2_code_free(code_);
    }
}

std::optional<Regex> Regex::compile(std::string_view pattern) {
    std::string error_message;
    return compile(pattern, error_message);
}

std::optional<Regex> Regex::compile(std::string_view pattern, std::string& error_message) {
    int error_code;
    PCRE2_SIZE error_offset;

    auto* code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(),
                               0,  // options (default)
                               &error_code, &error_offset, nullptr);

    if (!code) {
        error_message = get_pcre2_error(error_code) + " at offset " + std::to_string(error_offset) +
                        " in pattern: " + std::string(pattern);
        return std::nullopt;
    }

    return Regex(code, std::string(pattern));
}

bool Regex::matches(std::string_view subject) const {
    if (!code_) {
        return false;
    }

    auto* match_data = pcre2_match_data_create_from_pattern(code_, nullptr);
    if (!match_data) {
        return false;
    }

    int rc = pcre2_match(code_, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(),
                         0,  // start offset
                         0,  // options
                         match_data, nullptr);

    pcre2_match_data_free(match_data);

    return rc >= 0;
}

std::string Regex::quote(std::string_view text) {
    static constexpr std::string_view kMeta = "\\^$.|?*+()[]{}";

    std::string quoted;
    quoted.reserve(text.size() * 2);
    for (char c : text) {
        if (kMeta.find(c) != std::string_view::npos) {
            quoted += '\\';
        }
        quoted += c;
    }
    return quoted;
}

}  // namespace conduit::http
