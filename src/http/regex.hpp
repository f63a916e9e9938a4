#pragma once

#include <optional>
#include <string>
#include <string_view>

// Forward declare PCRE2 types to avoid header pollution
struct pcre2_real_code_8;

namespace conduit::http {

// PCRE2 wrapper for path pattern matching
// Thread-safe for read operations after compilation
class Regex {
public:
    // Compile a regex pattern
    // Returns nullopt if compilation fails
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern);

    // Compile a regex pattern with error message
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      std::string& error_message);

    // Move-only type (manages PCRE2 resources)
    Regex(Regex&& other) noexcept;
    Regex& operator=(Regex&& other) noexcept;
    ~Regex();

    Regex(const Regex&) = delete;
    Regex& operator=(const Regex&) = delete;

    // Match anywhere in subject (anchor the pattern for whole-string matches)
    [[nodiscard]] bool matches(std::string_view subject) const;

    // Get the original pattern string
    [[nodiscard]] std::string_view pattern() const { return pattern_; }

    // Escape regex metacharacters so text matches literally
    [[nodiscard]] static std::string quote(std::string_view text);

private:
    explicit Regex(pcre2_real_code_8* code, std::string pattern);

    pcre2_real_code_8* code_;  // Compiled regex (owned)
    std::string pattern_;      // Original pattern (for debugging)
};

}  // namespace conduit::http
