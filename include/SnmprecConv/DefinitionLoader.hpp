#pragma once
// DefinitionLoader.hpp – Parses a sanitized capture export into records.
//
// Accepted layouts (both produced by the capture tool over time):
//   <Simulation><Definitions><Definition OID=".." Type=".." ReturnValue=".."/>
//   <Simulation><Definition .../>                      (legacy, no wrapper)

#include "Sanitizer.hpp"
#include "Types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace snmprec {

// Maps a Type attribute to the closed type set, including the aliases
// ObjectId, IPAddress and Unsigned32.  std::nullopt for anything else.
[[nodiscard]] std::optional<OidType> oidTypeFromName(std::string_view name);

// Returns the definitions in document order.
// Throws ConversionError with MalformedXml, MissingAttribute, InvalidAttribute,
// InvalidOid, UnrecognizedType or NoDefinitions.
[[nodiscard]] std::vector<DefinitionRecord> loadDefinitions(const SanitizedDocument& doc);

} // namespace snmprec
