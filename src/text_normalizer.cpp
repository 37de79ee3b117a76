// -------------------------------------------------------------------------------------------------
//
// Copyright (C) all of the contributors. All rights reserved.
//
// This software, including documentation, is protected by copyright controlled by
// contributors. All rights are reserved. Copying, including reproducing, storing,
// adapting or translating, any or all of this material requires the prior written
// consent of all contributors.
//
// -------------------------------------------------------------------------------------------------

#include "text_normalizer.h"
#include <algorithm>

namespace {

// Invalid UTF-8 bytes are carried as k_raw_byte_base + byte and written back verbatim
constexpr char32_t k_raw_byte_base = 0x110000;

// ASCII base letters for U+00C0..U+00FF, '*' marks code points that do not decompose
const char* const k_latin1_fold =
    "AAAAAA*CEEEEIIII*NOOOOO**UUUUY**"
    "aaaaaa*ceeeeiiii*nooooo**uuuuy*y";

// ASCII base letters for U+0100..U+017F
const char* const k_latin_ext_a_fold =
    "AaAaAaCcCcCcCcDd**EeEeEeEeEeGgGgGgGgHh**IiIiIiIiI***JjKk*LlLlLlLl**NnNnNnn**"
    "OoOoOo**RrRrRrSsSsSsSsTtTt**UuUuUuUuUuUuWwYyYZzZzZzs";

std::vector<char32_t> decode_utf8(const std::string& text) {
    std::vector<char32_t> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        }

        size_t length = 0;
        char32_t cp = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            cp = lead & 0x07;
        }

        bool valid = length != 0 && i + length <= text.size();
        for (size_t k = 1; valid && k < length; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cont & 0x3F);
            }
        }

        if (valid) {
            const bool overlong = (length == 2 && cp < 0x80) ||
                                  (length == 3 && cp < 0x800) ||
                                  (length == 4 && cp < 0x10000);
            const bool surrogate = cp >= 0xD800 && cp <= 0xDFFF;
            valid = !overlong && !surrogate && cp <= 0x10FFFF;
        }

        if (!valid) {
            out.push_back(k_raw_byte_base + lead);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += length;
    }

    return out;
}

void encode_utf8(char32_t cp, std::string& out) {
    if (cp >= k_raw_byte_base) {
        out += static_cast<char>(cp - k_raw_byte_base);
    } else if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool is_space(char32_t cp) {
    return cp == 0x20 || (cp >= 0x09 && cp <= 0x0D) || cp == 0x85 || cp == 0xA0 ||
           cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
           cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

bool is_word(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') ||
               (cp >= '0' && cp <= '9') || cp == '_';
    }
    if (cp >= k_raw_byte_base) {
        return false;
    }
    // Latin-1 punctuation and symbols; superscripts, fractions and ordinals count as word characters
    if (cp >= 0xA1 && cp <= 0xBF) {
        return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 ||
               cp == 0xBA || cp == 0xBC || cp == 0xBD || cp == 0xBE;
    }
    if (cp == 0xD7 || cp == 0xF7) {
        return false;
    }
    // General Punctuation block
    if ((cp >= 0x2010 && cp <= 0x2027) || (cp >= 0x2030 && cp <= 0x205E)) {
        return false;
    }
    // Arrows, math operators, technical symbols, box drawing, dingbats;
    // enclosed alphanumerics (0x2460-0x24FF) stay word characters
    if ((cp >= 0x2190 && cp <= 0x245F) || (cp >= 0x2500 && cp <= 0x2BFF) ||
        (cp >= 0x2E00 && cp <= 0x2E7F)) {
        return false;
    }
    // CJK punctuation: 、。〃 brackets 〈〉《》「」『』【】 and the like, 〰 〽 ・
    if ((cp >= 0x3001 && cp <= 0x3004) || (cp >= 0x3008 && cp <= 0x3020) ||
        cp == 0x3030 || cp == 0x303D || cp == 0x30FB) {
        return false;
    }
    // Fullwidth ASCII punctuation and halfwidth CJK punctuation
    if ((cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
        (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65)) {
        return false;
    }
    // Sentence punctuation of other scripts
    switch (cp) {
    case 0x037E: case 0x0387:                                   // Greek
    case 0x055A: case 0x055B: case 0x055C: case 0x055D:
    case 0x055E: case 0x055F: case 0x0589:                      // Armenian
    case 0x05BE: case 0x05C0: case 0x05C3: case 0x05C6:
    case 0x05F3: case 0x05F4:                                   // Hebrew
    case 0x060C: case 0x061B: case 0x061F: case 0x066A:
    case 0x066B: case 0x066C: case 0x066D: case 0x06D4:         // Arabic
    case 0x0964: case 0x0965:                                   // Devanagari danda
    case 0x0E4F: case 0x0E5A: case 0x0E5B:                      // Thai
        return false;
    default:
        return true;
    }
}

/// Returns false when the code point has no ASCII form and must be dropped
bool fold_to_ascii(char32_t& cp) {
    if (cp < 0x80) {
        return true;
    }
    if (is_space(cp)) {
        cp = ' ';
        return true;
    }

    char folded = '*';
    if (cp >= 0xC0 && cp <= 0xFF) {
        folded = k_latin1_fold[cp - 0xC0];
    } else if (cp >= 0x100 && cp <= 0x17F) {
        folded = k_latin_ext_a_fold[cp - 0x100];
    }

    if (folded == '*') {
        return false;
    }
    cp = static_cast<char32_t>(folded);
    return true;
}

char32_t to_lower(char32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
    if (cp < 0xC0) return cp;
    if (cp <= 0xDE) return cp == 0xD7 ? cp : cp + 0x20;
    if (cp >= 0x100 && cp <= 0x137) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x139 && cp <= 0x148) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x14A && cp <= 0x177) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x178) return 0xFF;
    if (cp >= 0x179 && cp <= 0x17E) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20;
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
    return cp;
}

} // namespace

text_normalizer::text_normalizer()
    : text_normalizer(config{}) {
}

text_normalizer::text_normalizer(const config& cfg)
    : m_config(cfg)
    , m_strip_set(decode_utf8(cfg.strip_characters)) {
    std::sort(m_strip_set.begin(), m_strip_set.end());
    m_strip_set.erase(std::unique(m_strip_set.begin(), m_strip_set.end()), m_strip_set.end());
}

std::string text_normalizer::normalize(const std::string& text) const {
    std::string normalized;
    normalized.reserve(text.size());
    bool pending_space = false;

    for (char32_t cp : decode_utf8(text)) {
        if (m_config.fold_to_ascii && !fold_to_ascii(cp)) {
            continue;
        }

        if (is_space(cp)) {
            pending_space = !normalized.empty();
            continue;
        }

        if (m_config.lowercase) {
            cp = to_lower(cp);
        }

        if (std::binary_search(m_strip_set.begin(), m_strip_set.end(), cp)) {
            continue;
        }

        if (m_config.strip_all_punctuation && !is_word(cp)) {
            continue;
        }

        if (pending_space) {
            normalized += ' ';
            pending_space = false;
        }
        encode_utf8(cp, normalized);
    }

    return normalized;
}

std::vector<std::string> text_normalizer::words(const std::string& text) const {
    return split_words(normalize(text));
}

std::vector<std::string> text_normalizer::characters(const std::string& text) const {
    return split_code_points(normalize(text));
}

std::vector<std::string> text_normalizer::split_words(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string current;

    for (char c : normalized) {
        if (c == ' ' || (c >= '\t' && c <= '\r')) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

std::vector<std::string> text_normalizer::split_code_points(const std::string& utf8) {
    std::vector<std::string> chars;
    const auto code_points = decode_utf8(utf8);
    chars.reserve(code_points.size());

    for (char32_t cp : code_points) {
        std::string unit;
        encode_utf8(cp, unit);
        chars.push_back(unit);
    }

    return chars;
}
