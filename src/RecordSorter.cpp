// RecordSorter.cpp – Numeric OID ordering with duplicate rejection.

#include "SnmprecConv/RecordSorter.hpp"
#include "SnmprecConv/Oid.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace snmprec {

static std::string describe(const EncodedRecord& r) {
    return "definition " + std::to_string(r.index) +
           " (byte offset " + std::to_string(r.offset) + ")";
}

std::vector<EncodedRecord> sortRecords(std::vector<EncodedRecord> records) {
    // Stable so that the duplicate report names the earlier definition first.
    std::stable_sort(records.begin(), records.end(),
                     [](const EncodedRecord& a, const EncodedRecord& b) {
                         return compareOid(a.oid, b.oid) < 0;
                     });

    auto dup = std::adjacent_find(records.begin(), records.end(),
                                  [](const EncodedRecord& a, const EncodedRecord& b) {
                                      return compareOid(a.oid, b.oid) == 0;
                                  });
    if (dup != records.end())
        throw ConversionError(ErrorCode::DuplicateOid,
                              "OID " + formatOid(dup->oid) + " defined by " +
                              describe(*dup) + " and " + describe(*std::next(dup)));
    return records;
}

} // namespace snmprec
