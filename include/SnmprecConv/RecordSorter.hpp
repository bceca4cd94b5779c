#pragma once
// RecordSorter.hpp – Puts encoded records into snmprec order.
//
// The simulator walks the file sequentially for GETNEXT/GETBULK, so lines
// must be ascending by numeric OID: 1.3.6.1.2.1.2.2.1.6.9 precedes
// 1.3.6.1.2.1.2.2.1.6.10, and 1.3.6.1 precedes 1.3.6.1.0.

#include "Types.hpp"

#include <vector>

namespace snmprec {

// Sorts by component-wise numeric OID comparison.
// Throws ConversionError(DuplicateOid) naming both source definitions when
// two records share an OID.
[[nodiscard]] std::vector<EncodedRecord> sortRecords(std::vector<EncodedRecord> records);

} // namespace snmprec
