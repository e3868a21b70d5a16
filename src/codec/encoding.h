#pragma once
#include <optional>
#include <string>

// Decoders used by the scan rules. None of them throw on malformed input:
// a candidate that cannot be decoded is simply not a match.

namespace codec {

/**
 * @brief Decode base64 without insisting on padding
 *
 * Accepts the standard and URL-safe alphabets and ignores surrounding
 * whitespace. Decoding stops at the first character outside the alphabet,
 * so "rO0ABXNy...==; Path=/" decodes the leading token.
 *
 * @param input Candidate text
 * @return Decoded bytes, or nullopt if fewer than two base64 characters lead the input
 */
std::optional<std::string> base64_decode_lenient(const std::string& input);

/**
 * @brief Decode %XX escapes and '+' as space
 * @param input Candidate text
 * @return Decoded bytes, or nullopt if a '%' is not followed by two hex digits
 */
std::optional<std::string> percent_decode(const std::string& input);

/**
 * @brief Transcode UTF-8 text to ISO-8859-1 bytes
 * @param input UTF-8 text
 * @return Latin-1 bytes, or nullopt if the input is not valid UTF-8 or has code points above U+00FF
 */
std::optional<std::string> utf8_to_latin1(const std::string& input);

/**
 * @brief Replace HTML character references (&lt; &#60; &#x3c; ...) with their characters
 *
 * Unknown named references are left untouched. Numeric references are
 * emitted as UTF-8.
 */
std::string html_unescape(const std::string& input);

/**
 * @brief Heuristic check for binary content
 * @return true if the data has C0 control bytes (other than tab, CR, LF, FF) or is not valid UTF-8
 */
bool looks_binary(const std::string& data);

} // namespace codec
