#pragma once
// Types.hpp – Core data model and error taxonomy for the snmprec converter.
// Every conversion stage consumes and produces these structures.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace snmprec {

// ─── An OID is an ordered list of unsigned 32-bit sub-identifiers ─────────────
using Oid = std::vector<uint32_t>;

// ─── Declared SNMP type of a captured definition ─────────────────────────────
enum class OidType {
    OctetString,
    Integer,
    Integer32,
    Counter32,
    Counter64,
    Gauge32,          // also written as Unsigned32
    TimeTicks,
    IpAddress,
    ObjectIdentifier,
    Null,
    Opaque,
};

// Canonical type name, e.g. "OctetString".
const char* toString(OidType type) noexcept;

// ─── Error taxonomy ───────────────────────────────────────────────────────────
enum class ErrorCode {
    MalformedReference, // bad &#...; numeric character reference
    MalformedXml,       // parser failure or invalid UTF-8
    MissingAttribute,   // OID / Type / ReturnValue absent
    InvalidAttribute,   // optional attribute with an unusable value
    InvalidOid,         // empty, non-numeric or oversized OID component
    UnrecognizedType,   // Type attribute not in the closed set
    ValueNotNumeric,    // numeric / address type with non-numeric text
    ValueOutOfRange,    // numeric value outside the type's range
    DuplicateOid,       // two emitted definitions share an OID
    NoDefinitions,      // document holds no <Definition> elements
    Io,                 // read / write / rename failure
};

const char* toString(ErrorCode code) noexcept;

// Thrown by every conversion stage. All errors abort the whole run.
class ConversionError : public std::runtime_error {
public:
    ConversionError(ErrorCode code, const std::string& what)
        : std::runtime_error(std::string(toString(code)) + ": " + what),
          code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// ─── One <Definition> element as captured ─────────────────────────────────────
struct DefinitionRecord {
    Oid         oid;
    OidType     type{OidType::OctetString};
    std::string raw_value;   // bytes after placeholder substitution
    bool        skip{false}; // SkipOID

    // Simulator runtime hints; read and carried, never interpreted.
    std::optional<std::string> comment;
    std::optional<std::string> delay;
    std::optional<std::string> save;
    std::optional<std::string> log_output;

    // Source position: element ordinal and byte offset in the raw document.
    size_t      index{0};
    size_t      offset{0};
};

// ─── One line of the snmprec output ───────────────────────────────────────────
struct EncodedRecord {
    Oid         oid;
    uint16_t    tag{0};
    std::string value;       // hex, decimal or dotted-decimal text

    size_t      index{0};
    size_t      offset{0};
};

} // namespace snmprec
