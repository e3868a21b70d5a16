/**
 * @file encoding.cpp
 * @brief Lenient decoders for base64, percent-encoding, UTF-8 and HTML entities
 */

#include "encoding.h"
#include <openssl/evp.h>
#include <cctype>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <vector>

namespace codec {

static bool is_base64_char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '/' || c == '-' || c == '_';
}

std::optional<std::string> base64_decode_lenient(const std::string& input) {
    size_t start = input.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return std::nullopt;

    std::string run;
    for (size_t i = start; i < input.size(); i++) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (!is_base64_char(c)) break;
        // URL-safe alphabet maps onto the standard one
        run.push_back(c == '-' ? '+' : (c == '_' ? '/' : static_cast<char>(c)));
    }

    // A lone trailing character carries fewer than 8 bits
    if (run.size() % 4 == 1) run.pop_back();
    if (run.size() < 2) return std::nullopt;

    size_t padding = (4 - run.size() % 4) % 4;
    run.append(padding, '=');

    std::vector<unsigned char> out(run.size() / 4 * 3 + 1);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(run.data()),
                            static_cast<int>(run.size()));
    if (n < 0 || static_cast<size_t>(n) < padding) return std::nullopt;

    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n) - padding);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> percent_decode(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); i++) {
        char c = input[i];
        if (c == '%') {
            if (i + 2 >= input.size()) return std::nullopt;
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else if (c == '+') {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Decode one UTF-8 sequence at data[i], advancing i. Returns -1 when invalid.
static long next_code_point(const std::string& data, size_t& i) {
    unsigned char c = static_cast<unsigned char>(data[i]);
    int extra;
    long cp;
    if (c < 0x80) { i++; return c; }
    else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else return -1;

    if (i + extra >= data.size()) return -1;
    for (int k = 1; k <= extra; k++) {
        unsigned char cc = static_cast<unsigned char>(data[i + k]);
        if ((cc & 0xC0) != 0x80) return -1;
        cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return -1;
    if (cp > 0x10FFFF) return -1;
    i += extra + 1;
    return cp;
}

std::optional<std::string> utf8_to_latin1(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        long cp = next_code_point(input, i);
        if (cp < 0 || cp > 0xFF) return std::nullopt;
        out.push_back(static_cast<char>(cp));
    }
    return out;
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string html_unescape(const std::string& input) {
    static const std::map<std::string, uint32_t> named = {
        {"lt", '<'}, {"gt", '>'}, {"amp", '&'}, {"quot", '"'}, {"apos", '\''}, {"nbsp", 0xA0}
    };

    std::string out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '&') {
            out.push_back(input[i++]);
            continue;
        }
        size_t semi = input.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 12) {
            out.push_back(input[i++]);
            continue;
        }
        std::string ref = input.substr(i + 1, semi - i - 1);
        bool decoded = false;
        if (ref.size() > 1 && ref[0] == '#') {
            try {
                size_t used = 0;
                unsigned long cp = (ref[1] == 'x' || ref[1] == 'X')
                    ? std::stoul(ref.substr(2), &used, 16)
                    : std::stoul(ref.substr(1), &used, 10);
                size_t expected = (ref[1] == 'x' || ref[1] == 'X') ? ref.size() - 2 : ref.size() - 1;
                if (used == expected && cp > 0 && cp <= 0x10FFFF) {
                    append_utf8(out, static_cast<uint32_t>(cp));
                    decoded = true;
                }
            } catch (const std::exception&) {
                decoded = false;
            }
        } else {
            auto it = named.find(ref);
            if (it != named.end()) {
                append_utf8(out, it->second);
                decoded = true;
            }
        }
        if (decoded) {
            i = semi + 1;
        } else {
            out.push_back(input[i++]);
        }
    }
    return out;
}

bool looks_binary(const std::string& data) {
    for (unsigned char c : data) {
        if (c < 0x20 && c != '\t' && c != '\r' && c != '\n' && c != '\f') {
            return true;
        }
    }
    size_t i = 0;
    while (i < data.size()) {
        if (next_code_point(data, i) < 0) return true;
    }
    return false;
}

} // namespace codec
