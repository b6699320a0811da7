/**
 * @file utf8.hpp
 * @brief UTF-8 helpers for packgraph.
 *
 * Provides validation, single code point extraction and encoding of Unicode
 * code points as UTF-8 byte sequences.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <stdexcept>

namespace packgraph::utf8 {

    /**
     * @brief Decode the code point starting at @p pos and advance @p pos past it.
     * @return The code point, or std::nullopt on an invalid or overlong sequence
     */
    inline std::optional<char32_t> next(std::string_view s, size_t& pos) {
        if (pos >= s.size()) return std::nullopt;
        const auto b0 = static_cast<uint8_t>(s[pos]);
        size_t len;
        char32_t cp;
        if (b0 < 0x80) { len = 1; cp = b0; }
        else if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
        else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
        else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; }
        else return std::nullopt;

        if (pos + len > s.size()) return std::nullopt;
        for (size_t i = 1; i < len; ++i) {
            const auto b = static_cast<uint8_t>(s[pos + i]);
            if ((b & 0xC0) != 0x80) return std::nullopt;
            cp = (cp << 6) | (b & 0x3F);
        }
        // overlong forms, surrogates and out of range values
        static const char32_t minForLen[]{ 0, 0, 0x80, 0x800, 0x10000 };
        if (cp < minForLen[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return std::nullopt;
        pos += len;
        return cp;
    }

    /**
     * @brief Check that a byte string is well-formed UTF-8.
     */
    inline bool isValid(std::string_view s) {
        size_t pos = 0;
        while (pos < s.size()) {
            if (!next(s, pos)) return false;
        }
        return true;
    }

    /**
     * @brief Return the code point if @p s holds exactly one, std::nullopt otherwise.
     */
    inline std::optional<char32_t> singleCodePoint(std::string_view s) {
        size_t pos = 0;
        auto cp = next(s, pos);
        if (!cp || pos != s.size()) return std::nullopt;
        return cp;
    }

    /**
     * @brief Encode a code point as UTF-8.
     * @throws std::invalid_argument if @p cp is not a Unicode scalar value
     */
    inline std::string encode(char32_t cp) {
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            throw std::invalid_argument("utf8::encode: not a Unicode scalar value");
        std::string out;
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
        return out;
    }

}
