// Sanitizer.cpp – Reversible escaping of XML-forbidden character references.
//
// Two passes over the raw buffer:
//   1. Locate every "&#...;" reference outside comments and CDATA sections,
//      decode it, and record which private-use code points the document
//      already uses (literally or via a reference).  The first unused one
//      becomes the placeholder marker.
//   2. Copy the buffer, substituting a fresh placeholder for each reference
//      to a disallowed character.

#include "SnmprecConv/Sanitizer.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

namespace snmprec {

static constexpr uint32_t kPuaFirst     = 0xE000;
static constexpr uint32_t kPuaLast      = 0xF8FF;
static constexpr uint32_t kMaxCodePoint = 0x10FFFF;

namespace {

struct CharRef {
    size_t   begin;  // offset of '&'
    size_t   end;    // one past ';'
    uint32_t cp;
};

} // namespace

static bool isDigit(char c)    { return c >= '0' && c <= '9'; }

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

[[noreturn]] static void malformed(size_t offset, const std::string& why) {
    throw ConversionError(ErrorCode::MalformedReference,
                          "character reference at byte offset " +
                          std::to_string(offset) + ": " + why);
}

// Parses the reference whose '&' is at raw[at] (raw[at + 1] == '#').
static CharRef parseCharRef(std::string_view raw, size_t at) {
    size_t pos = at + 2;
    bool   hex = false;
    if (pos < raw.size() && (raw[pos] == 'x' || raw[pos] == 'X')) {
        hex = true;
        ++pos;
    }

    size_t   digits_begin = pos;
    uint32_t cp           = 0;
    bool     too_large    = false;
    while (pos < raw.size()) {
        int d = hex ? hexValue(raw[pos]) : (isDigit(raw[pos]) ? raw[pos] - '0' : -1);
        if (d < 0) break;
        if (!too_large) {
            uint64_t next = static_cast<uint64_t>(cp) * (hex ? 16u : 10u) + static_cast<uint64_t>(d);
            if (next > kMaxCodePoint) too_large = true;
            else                      cp = static_cast<uint32_t>(next);
        }
        ++pos;
    }

    if (pos == digits_begin) {
        if (pos >= raw.size()) malformed(at, "unterminated reference");
        malformed(at, std::string("expected ") + (hex ? "hex" : "decimal") +
                      " digits, found '" + raw[pos] + "'");
    }
    if (pos >= raw.size())
        malformed(at, "unterminated reference");
    if (raw[pos] != ';')
        malformed(at, std::string("unexpected character '") + raw[pos] + "' before ';'");
    if (too_large)
        malformed(at, "code point beyond U+10FFFF");

    return CharRef{at, pos + 1, cp};
}

// Generalised UTF-8: surrogates are encoded like any other BMP code point so
// that the original reference value can always be reproduced.
static std::string encodeUtf8(uint32_t cp) {
    std::string out;
    if (cp < 0x80) {
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
    return out;
}

static bool isContinuation(unsigned char b) { return (b & 0xC0u) == 0x80u; }

// One past the end of the comment or CDATA section opening at raw[at], or 0
// if none opens there.  An unterminated section runs to the end of input.
static size_t opaqueSectionEnd(std::string_view raw, size_t at) {
    std::string_view open;
    std::string_view close;
    if (raw.substr(at, 4) == "<!--") {
        open  = "<!--";
        close = "-->";
    } else if (raw.substr(at, 9) == "<![CDATA[") {
        open  = "<![CDATA[";
        close = "]]>";
    } else {
        return 0;
    }
    size_t end = raw.find(close, at + open.size());
    return end == std::string_view::npos ? raw.size() : end + close.size();
}

// ─────────────────────────────────────────────────────────────────────────────
//  EscapeMap
// ─────────────────────────────────────────────────────────────────────────────

void EscapeMap::add(std::string token, std::string bytes) {
    entries_[std::move(token)] = std::move(bytes);
}

const std::string* EscapeMap::find(std::string_view token) const {
    auto it = entries_.find(token);
    return it == entries_.end() ? nullptr : &it->second;
}

std::string EscapeMap::unescape(std::string_view text) const {
    if (entries_.empty() || marker_.empty())
        return std::string(text);

    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find(marker_, pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));

        size_t close = text.find(marker_, open + marker_.size());
        if (close == std::string_view::npos)
            throw ConversionError(ErrorCode::MalformedXml,
                                  "truncated escape placeholder in attribute value");

        std::string_view token = text.substr(open, close + marker_.size() - open);
        const std::string* bytes = find(token);
        if (!bytes)
            throw ConversionError(ErrorCode::MalformedXml,
                                  "unknown escape placeholder in attribute value");
        out += *bytes;
        pos = close + marker_.size();
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
//  SanitizedDocument
// ─────────────────────────────────────────────────────────────────────────────

size_t SanitizedDocument::sourceOffset(size_t sanitized_offset) const noexcept {
    auto it = std::upper_bound(replacements.begin(), replacements.end(), sanitized_offset,
                               [](size_t off, const Replacement& r) {
                                   return off < r.sanitized_begin;
                               });
    if (it == replacements.begin())
        return sanitized_offset;

    const Replacement& r = *std::prev(it);
    if (sanitized_offset < r.sanitized_end)
        return r.raw_begin;
    return r.raw_end + (sanitized_offset - r.sanitized_end);
}

// ─────────────────────────────────────────────────────────────────────────────
//  sanitize
// ─────────────────────────────────────────────────────────────────────────────

SanitizedDocument sanitize(std::string_view raw) {
    // ── Pass 1: references and private-use code points in use ───────────────
    std::vector<CharRef> refs;
    std::vector<bool>    pua_used(kPuaLast - kPuaFirst + 1, false);

    auto markUsed = [&](uint32_t cp) {
        if (cp >= kPuaFirst && cp <= kPuaLast) pua_used[cp - kPuaFirst] = true;
    };

    // U+E000..U+F8FF are three-byte sequences with lead byte EE or EF.
    auto markLiteral = [&](size_t i) {
        auto b = static_cast<unsigned char>(raw[i]);
        if ((b == 0xEE || b == 0xEF) && i + 2 < raw.size() &&
            isContinuation(static_cast<unsigned char>(raw[i + 1])) &&
            isContinuation(static_cast<unsigned char>(raw[i + 2]))) {
            markUsed(((b & 0x0Fu) << 12) |
                     ((static_cast<unsigned char>(raw[i + 1]) & 0x3Fu) << 6) |
                     (static_cast<unsigned char>(raw[i + 2]) & 0x3Fu));
        }
    };

    for (size_t i = 0; i < raw.size(); ++i) {
        // The parser does not expand references in comments or CDATA, so
        // their text is copied as is.
        if (raw[i] == '<') {
            if (size_t end = opaqueSectionEnd(raw, i)) {
                for (size_t j = i; j < end; ++j) markLiteral(j);
                i = end - 1;
                continue;
            }
        }

        if (raw[i] == '&' && i + 1 < raw.size() && raw[i + 1] == '#') {
            CharRef ref = parseCharRef(raw, i);
            markUsed(ref.cp);
            refs.push_back(ref);
            i = ref.end - 1;
            continue;
        }

        markLiteral(i);
    }

    SanitizedDocument doc;

    bool any_disallowed = std::any_of(refs.begin(), refs.end(),
                                      [](const CharRef& r) { return isDisallowedXmlChar(r.cp); });
    if (!any_disallowed) {
        doc.text.assign(raw);
        return doc;
    }

    auto free_it = std::find(pua_used.begin(), pua_used.end(), false);
    if (free_it == pua_used.end())
        malformed(0, "no private-use character left to build placeholders");
    uint32_t marker_cp = kPuaFirst + static_cast<uint32_t>(free_it - pua_used.begin());
    std::string marker = encodeUtf8(marker_cp);
    doc.escapes = EscapeMap(marker);

    // ── Pass 2: rewrite ─────────────────────────────────────────────────────
    doc.text.reserve(raw.size());
    size_t copied  = 0;
    size_t counter = 0;
    for (const CharRef& ref : refs) {
        if (!isDisallowedXmlChar(ref.cp)) continue;

        doc.text.append(raw.substr(copied, ref.begin - copied));
        copied = ref.end;

        std::string token = marker + std::to_string(counter++) + marker;
        SanitizedDocument::Replacement rep{};
        rep.raw_begin       = ref.begin;
        rep.raw_end         = ref.end;
        rep.sanitized_begin = doc.text.size();
        rep.sanitized_end   = doc.text.size() + token.size();
        doc.replacements.push_back(rep);

        doc.text += token;
        doc.escapes.add(std::move(token), encodeUtf8(ref.cp));
    }
    doc.text.append(raw.substr(copied));
    return doc;
}

} // namespace snmprec
