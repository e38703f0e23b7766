#ifndef TRMCPS_UTF8_SANITIZE_HPP
#define TRMCPS_UTF8_SANITIZE_HPP

// UTF-8 checks for file contents that are echoed back inside JSON responses.
// nlohmann::json refuses to serialize invalid UTF-8, so anything read from disk
// passes through here before it is placed in a response.

#include <string>

namespace utf8_sanitize {

// True when text is entirely well-formed UTF-8 (no overlongs, no surrogates).
bool is_valid(const std::string &text);

// Replaces every ill-formed byte with U+FFFD. In-place version.
void sanitize(std::string &text);

// Replaces every ill-formed byte with U+FFFD. Returns a new string.
std::string sanitize(const std::string &text);

} // namespace utf8_sanitize

#endif // TRMCPS_UTF8_SANITIZE_HPP
