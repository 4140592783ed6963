#ifndef RPCWORKER_UTF8_SANITIZE_HPP
#define RPCWORKER_UTF8_SANITIZE_HPP

#include <string>

namespace utf8_sanitize {

// True when text is well-formed UTF-8 (no overlongs, surrogates or code points above U+10FFFF).
bool is_valid(const std::string &text);

// Replaces each ill-formed byte with U+FFFD. In-place version.
void sanitize(std::string &text);

// Replaces each ill-formed byte with U+FFFD. Returns a new string.
std::string sanitize(const std::string &text);

} // namespace utf8_sanitize

#endif // RPCWORKER_UTF8_SANITIZE_HPP
