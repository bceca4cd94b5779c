#pragma once
// ValueEncoder.hpp – Maps a definition's declared type and captured value to
// an snmprec wire tag and printable value text.
//
//   type                 tag  value
//   OctetString            4  lowercase hex, two digits per byte
//   Integer / Integer32    2  signed decimal, -2^31 .. 2^31-1
//   Null                   5  empty
//   ObjectIdentifier       6  dotted decimal
//   IpAddress             64  dotted quad
//   Counter32             65  0 .. 2^32-1
//   Gauge32 / Unsigned32  66  0 .. 2^32-1
//   TimeTicks             67  0 .. 2^32-1
//   Opaque                68  lowercase hex
//   Counter64             70  0 .. 2^64-1

#include "Types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace snmprec {

namespace tag {
inline constexpr uint16_t Integer          = 2;
inline constexpr uint16_t OctetString      = 4;
inline constexpr uint16_t Null             = 5;
inline constexpr uint16_t ObjectIdentifier = 6;
inline constexpr uint16_t IpAddress        = 64;
inline constexpr uint16_t Counter32        = 65;
inline constexpr uint16_t Gauge32          = 66;
inline constexpr uint16_t TimeTicks        = 67;
inline constexpr uint16_t Opaque           = 68;
inline constexpr uint16_t Counter64        = 70;
} // namespace tag

[[nodiscard]] uint16_t typeTag(OidType type) noexcept;

// Two lowercase hex digits per byte, no separators.
[[nodiscard]] std::string hexEncode(std::string_view bytes);

// Inverse of hexEncode (either case accepted); std::nullopt on odd length or
// a non-hex digit.
[[nodiscard]] std::optional<std::string> hexDecode(std::string_view hex);

// Throws ConversionError (ValueNotNumeric, ValueOutOfRange, InvalidOid) naming
// the record's OID.
[[nodiscard]] EncodedRecord encodeRecord(const DefinitionRecord& rec);

} // namespace snmprec
