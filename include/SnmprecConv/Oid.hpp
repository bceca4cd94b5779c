#pragma once
// Oid.hpp – Parsing, formatting and ordering of dotted-decimal OIDs.

#include "Types.hpp"
#include <string>
#include <string_view>

namespace snmprec {

// Parses "1.3.6.1.2.1.1.1.0" into its components.
// Returns std::nullopt for an empty string, an empty component
// ("1..2", ".1", "1."), a non-digit character or a component above 2^32-1.
[[nodiscard]] std::optional<Oid> tryParseOid(std::string_view text);

// Same as tryParseOid() but throws ConversionError(InvalidOid); `context`
// prefixes the message.
[[nodiscard]] Oid parseOid(std::string_view text, const std::string& context);

// Renders components joined by '.'.
[[nodiscard]] std::string formatOid(const Oid& oid);

// Component-wise numeric three-way comparison; a strict prefix sorts first.
[[nodiscard]] int compareOid(const Oid& a, const Oid& b) noexcept;

} // namespace snmprec
