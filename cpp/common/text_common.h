#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

// ───────────────────────────────────────────────────────────────
// UTF-8
// ───────────────────────────────────────────────────────────────

// Sequence length announced by a lead byte, 0 for a stray continuation
// byte or an invalid lead.
inline std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

// Decodes one code point at data[i] and advances i. On a malformed
// sequence (truncated, overlong, surrogate, > U+10FFFF) cp becomes U+FFFD,
// i moves past the lead byte only, and false is returned.
inline bool decode_utf8_cp(
    const unsigned char* data,
    std::size_t n,
    std::size_t& i,
    std::uint32_t& cp
) {
    if (i >= n) return false;

    static constexpr std::uint32_t LEAD_MASK[5] = {0, 0x7F, 0x1F, 0x0F, 0x07};
    static constexpr std::uint32_t MIN_CP[5]    = {0, 0, 0x80, 0x800, 0x10000};

    const std::size_t len = utf8_sequence_length(data[i]);
    if (len == 0 || i + len > n) {
        cp = 0xFFFD;
        ++i;
        return false;
    }

    std::uint32_t v = data[i] & LEAD_MASK[len];
    for (std::size_t k = 1; k < len; ++k) {
        const unsigned char c = data[i + k];
        if ((c & 0xC0) != 0x80) {
            cp = 0xFFFD;
            ++i;
            return false;
        }
        v = (v << 6) | (c & 0x3F);
    }

    if (v < MIN_CP[len] || v > 0x10FFFF || (v >= 0xD800 && v <= 0xDFFF)) {
        cp = 0xFFFD;
        ++i;
        return false;
    }

    cp = v;
    i += len;
    return true;
}

inline void append_utf8_cp(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
        return;
    }
    const int len = cp < 0x800 ? 2 : (cp < 0x10000 ? 3 : 4);
    static constexpr unsigned char LEAD_BITS[5] = {0, 0, 0xC0, 0xE0, 0xF0};

    char buf[4];
    for (int k = len - 1; k > 0; --k) {
        buf[k] = static_cast<char>(0x80 | (cp & 0x3F));
        cp >>= 6;
    }
    buf[0] = static_cast<char>(LEAD_BITS[len] | cp);
    out.append(buf, static_cast<std::size_t>(len));
}

inline std::vector<std::uint32_t> utf8_code_points(std::string_view s) {
    std::vector<std::uint32_t> out;
    out.reserve(s.size());

    const auto* data = reinterpret_cast<const unsigned char*>(s.data());
    const std::size_t n = s.size();
    std::size_t i = 0;
    while (i < n) {
        std::uint32_t cp = 0;
        decode_utf8_cp(data, n, i, cp);
        out.push_back(cp);
    }
    return out;
}

// ───────────────────────────────────────────────────────────────
// Script classes
// ───────────────────────────────────────────────────────────────

// CJK Unified Ideographs + Extensions A..G.
// Shard routing depends on this exact set: keep it the single definition.
inline bool is_han_cp(std::uint32_t cp) {
    return (cp >= 0x4E00  && cp <= 0x9FFF)  ||  // CJK Unified Ideographs
           (cp >= 0x3400  && cp <= 0x4DBF)  ||  // Extension A
           (cp >= 0x20000 && cp <= 0x2A6DF) ||  // Extension B
           (cp >= 0x2A700 && cp <= 0x2B73F) ||  // Extension C
           (cp >= 0x2B740 && cp <= 0x2B81F) ||  // Extension D
           (cp >= 0x2B820 && cp <= 0x2CEAF) ||  // Extension E
           (cp >= 0x2CEB0 && cp <= 0x2EBEF) ||  // Extension F
           (cp >= 0x30000 && cp <= 0x3134F);    // Extension G
}

inline std::size_t count_han_cps(std::string_view s) {
    const auto* data = reinterpret_cast<const unsigned char*>(s.data());
    const std::size_t n = s.size();

    std::size_t count = 0;
    std::size_t i = 0;
    while (i < n) {
        std::uint32_t cp = 0;
        if (decode_utf8_cp(data, n, i, cp) && is_han_cp(cp)) {
            ++count;
        }
    }
    return count;
}

// ───────────────────────────────────────────────────────────────
// Key normalization
// ───────────────────────────────────────────────────────────────

inline bool is_key_space_cp(std::uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\r' || cp == '\n' ||
           cp == 0x00A0 || cp == 0x3000;
}

// Width + case folding only: full-width ASCII (U+FF01..U+FF5E) -> ASCII,
// ASCII A-Z -> a-z. Han/kana code points pass through untouched, so
// Traditional/Simplified/shinjitai distinctions survive.
inline std::uint32_t fold_key_cp(std::uint32_t cp) {
    if (cp >= 0xFF01 && cp <= 0xFF5E) {
        cp = cp - 0xFF01 + 0x21;
    }
    if (cp >= 'A' && cp <= 'Z') {
        cp += 32;
    }
    return cp;
}

inline std::string normalize_match_key(std::string_view in) {
    std::vector<std::uint32_t> cps = utf8_code_points(in);

    std::size_t start = 0;
    std::size_t end   = cps.size();
    while (start < end && is_key_space_cp(cps[start])) ++start;
    while (end > start && is_key_space_cp(cps[end - 1])) --end;

    std::string out;
    out.reserve(in.size());
    for (std::size_t i = start; i < end; ++i) {
        append_utf8_cp(out, fold_key_cp(cps[i]));
    }
    return out;
}
