#pragma once
// Sanitizer.hpp – Makes capture exports well-formed XML without losing bytes.
//
// Capture tools write non-printable payload bytes as numeric character
// references ("&#x0;", "&#27;").  XML forbids most C0 controls even in that
// form, so a conforming parser rejects the whole document.  The sanitizer
// swaps each forbidden reference for a unique placeholder token and keeps the
// original bytes in an EscapeMap; the loader swaps them back after parsing.
//
// Placeholder layout:  <M> counter <M>
//   M       = a Unicode private-use character absent from the input
//   counter = decimal, incremented per replaced reference

#include "Types.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace snmprec {

// ─────────────────────────────────────────────────────────────────────────────
//  EscapeMap
// ─────────────────────────────────────────────────────────────────────────────
class EscapeMap {
public:
    EscapeMap() = default;
    explicit EscapeMap(std::string marker) : marker_(std::move(marker)) {}

    void add(std::string token, std::string bytes);

    [[nodiscard]] size_t size()  const noexcept { return entries_.size(); }
    [[nodiscard]] bool   empty() const noexcept { return entries_.empty(); }

    // UTF-8 encoding of the delimiter character; empty if nothing was escaped.
    [[nodiscard]] const std::string& marker() const noexcept { return marker_; }

    // Original bytes for a token, or nullptr if the token is unknown.
    [[nodiscard]] const std::string* find(std::string_view token) const;

    // Replaces every placeholder in `text` by its original bytes.
    // Text without placeholders is returned verbatim.
    // Throws ConversionError(MalformedXml) on a truncated or unknown token.
    [[nodiscard]] std::string unescape(std::string_view text) const;

private:
    std::string marker_;
    std::map<std::string, std::string, std::less<>> entries_;
};

// ─────────────────────────────────────────────────────────────────────────────
//  SanitizedDocument
// ─────────────────────────────────────────────────────────────────────────────
struct SanitizedDocument {
    // One replaced reference: [raw_begin, raw_end) became
    // [sanitized_begin, sanitized_end).
    struct Replacement {
        size_t raw_begin;
        size_t raw_end;
        size_t sanitized_begin;
        size_t sanitized_end;
    };

    std::string              text;
    EscapeMap                escapes;
    std::vector<Replacement> replacements; // ascending by position

    // Maps a byte offset in `text` back to the raw document.  Offsets that
    // fall inside a placeholder map to the start of the original reference.
    [[nodiscard]] size_t sourceOffset(size_t sanitized_offset) const noexcept;
};

// ─── XML 1.0 character validity for numeric references ───────────────────────
// True for C0 controls other than TAB/LF/CR, surrogates, U+FFFE and U+FFFF.
[[nodiscard]] constexpr bool isDisallowedXmlChar(uint32_t cp) noexcept {
    if (cp < 0x20) return cp != 0x09 && cp != 0x0A && cp != 0x0D;
    if (cp >= 0xD800 && cp <= 0xDFFF) return true;
    return cp == 0xFFFE || cp == 0xFFFF;
}

// Rewrites `raw` so every disallowed numeric character reference becomes a
// placeholder.  All other bytes are copied unchanged.
// Throws ConversionError(MalformedReference) with the byte offset of the '&'
// for an unterminated or non-numeric reference or a code point past U+10FFFF.
[[nodiscard]] SanitizedDocument sanitize(std::string_view raw);

} // namespace snmprec
