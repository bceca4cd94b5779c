// DefinitionLoader.cpp – Extracts <Definition> records from a capture export.
// Uses pugixml for parsing; placeholders left by the sanitizer are swapped
// back to their original bytes here.

#include "SnmprecConv/DefinitionLoader.hpp"
#include "SnmprecConv/Oid.hpp"

#include <pugixml.hpp>

#include <cstring>
#include <string>

namespace snmprec {

// ─── Type names ───────────────────────────────────────────────────────────────

std::optional<OidType> oidTypeFromName(std::string_view name) {
    if (name == "OctetString")      return OidType::OctetString;
    if (name == "Integer")          return OidType::Integer;
    if (name == "Integer32")        return OidType::Integer32;
    if (name == "Counter32")        return OidType::Counter32;
    if (name == "Counter64")        return OidType::Counter64;
    if (name == "Gauge32")          return OidType::Gauge32;
    if (name == "Unsigned32")       return OidType::Gauge32;
    if (name == "TimeTicks")        return OidType::TimeTicks;
    if (name == "IpAddress")        return OidType::IpAddress;
    if (name == "IPAddress")        return OidType::IpAddress;
    if (name == "ObjectIdentifier") return OidType::ObjectIdentifier;
    if (name == "ObjectId")         return OidType::ObjectIdentifier;
    if (name == "Null")             return OidType::Null;
    if (name == "Opaque")           return OidType::Opaque;
    return std::nullopt;
}

// ─── Small parsing helpers ────────────────────────────────────────────────────

// Offset of the first byte that does not start or continue a well-formed
// UTF-8 sequence (overlongs, surrogates and code points past U+10FFFF
// rejected).
static std::optional<size_t> findInvalidUtf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        auto b = static_cast<unsigned char>(s[i]);
        size_t   len = 0;
        uint32_t min = 0;
        uint32_t cp  = 0;
        if      (b < 0x80)           { ++i; continue; }
        else if ((b & 0xE0) == 0xC0) { len = 2; min = 0x80;    cp = b & 0x1Fu; }
        else if ((b & 0xF0) == 0xE0) { len = 3; min = 0x800;   cp = b & 0x0Fu; }
        else if ((b & 0xF8) == 0xF0) { len = 4; min = 0x10000; cp = b & 0x07u; }
        else return i;

        if (i + len > s.size()) return i;
        for (size_t k = 1; k < len; ++k) {
            auto c = static_cast<unsigned char>(s[i + k]);
            if ((c & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (c & 0x3Fu);
        }
        if (cp < min || cp > 0x10FFFF) return i;
        if (cp >= 0xD800 && cp <= 0xDFFF) return i;
        i += len;
    }
    return std::nullopt;
}

static bool equalsIgnoreCase(std::string_view a, const char* b) {
    if (a.size() != std::strlen(b)) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (x != b[i]) return false;
    }
    return true;
}

static bool parseSkip(std::string_view v, const std::string& ctx) {
    if (v.empty())                                                     return false;
    if (equalsIgnoreCase(v, "true")  || equalsIgnoreCase(v, "yes") || v == "1") return true;
    if (equalsIgnoreCase(v, "false") || equalsIgnoreCase(v, "no")  || v == "0") return false;
    throw ConversionError(ErrorCode::InvalidAttribute,
                          ctx + ": SkipOID value '" + std::string(v) + "' is not a boolean");
}

// ─── One <Definition> element ─────────────────────────────────────────────────

static DefinitionRecord parseDefinition(pugi::xml_node node, size_t index,
                                        const SanitizedDocument& doc) {
    DefinitionRecord rec;
    rec.index = index;
    ptrdiff_t off = node.offset_debug();
    rec.offset = off < 0 ? 0 : doc.sourceOffset(static_cast<size_t>(off));

    const std::string ctx = "definition " + std::to_string(index) +
                            " (byte offset " + std::to_string(rec.offset) + ")";

    auto required = [&](const char* name) {
        pugi::xml_attribute a = node.attribute(name);
        if (!a)
            throw ConversionError(ErrorCode::MissingAttribute,
                                  ctx + ": missing '" + name + "' attribute");
        return doc.escapes.unescape(a.value());
    };

    std::string oid_text   = required("OID");
    std::string type_text  = required("Type");
    rec.raw_value          = required("ReturnValue");

    rec.oid = parseOid(oid_text, ctx);

    auto type = oidTypeFromName(type_text);
    if (!type)
        throw ConversionError(ErrorCode::UnrecognizedType,
                              ctx + ", OID " + oid_text + ": unknown type '" + type_text + "'");
    rec.type = *type;

    if (auto a = node.attribute("Comment");   a) rec.comment    = doc.escapes.unescape(a.value());
    if (auto a = node.attribute("Delay");     a) rec.delay      = doc.escapes.unescape(a.value());
    if (auto a = node.attribute("Save");      a) rec.save       = doc.escapes.unescape(a.value());
    if (auto a = node.attribute("LogOutput"); a) rec.log_output = doc.escapes.unescape(a.value());
    if (auto a = node.attribute("SkipOID");   a) rec.skip       = parseSkip(a.value(), ctx);

    return rec;
}

// ─── Public entry point ───────────────────────────────────────────────────────

std::vector<DefinitionRecord> loadDefinitions(const SanitizedDocument& doc) {
    if (auto bad = findInvalidUtf8(doc.text))
        throw ConversionError(ErrorCode::MalformedXml,
                              "invalid UTF-8 at byte offset " +
                              std::to_string(doc.sourceOffset(*bad)));

    pugi::xml_document xml;
    pugi::xml_parse_result result = xml.load_buffer(doc.text.data(), doc.text.size(),
                                                    pugi::parse_default, pugi::encoding_utf8);
    if (!result)
        throw ConversionError(ErrorCode::MalformedXml,
                              std::string(result.description()) + " at byte offset " +
                              std::to_string(doc.sourceOffset(static_cast<size_t>(result.offset))));

    pugi::xml_node root = xml.document_element();

    // Every <Definitions> block contributes, in document order.
    std::vector<pugi::xml_node> nodes;
    for (auto block : root.children("Definitions"))
        for (auto n : block.children("Definition"))
            nodes.push_back(n);
    if (nodes.empty()) {
        for (auto n : root.children("Definition"))
            nodes.push_back(n);
    }
    if (nodes.empty())
        throw ConversionError(ErrorCode::NoDefinitions,
                              "no <Definition> elements under <" + std::string(root.name()) + ">");

    std::vector<DefinitionRecord> out;
    out.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i)
        out.push_back(parseDefinition(nodes[i], i, doc));
    return out;
}

} // namespace snmprec
