#pragma once
// Converter.hpp – Public capture-to-snmprec API.
//
// Usage example:
//   ConvertOptions opts;
//   auto result = convertFile("capture.xml", "data/device.snmprec", opts);
//   std::cout << result.records.size() << " OIDs written\n";
//
// Pipeline: sanitize → loadDefinitions → encodeRecord → sortRecords →
// writeSnmprec.  Any error aborts the run before the destination is touched.

#include "SnmprecWriter.hpp"
#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace snmprec {

struct ConvertOptions {
    // When set, the sanitized XML is written here for inspection.  Must not
    // name the same file as the output.
    std::optional<std::filesystem::path> sanitized_copy;

    WriteOptions write;
};

struct ConversionResult {
    std::vector<EncodedRecord> records;   // sorted, ready to emit
    size_t definitions{0};                // <Definition> elements read
    size_t skipped{0};                    // dropped via SkipOID
    size_t escapes{0};                    // references replaced by placeholders
};

// In-memory pipeline (no file output).
[[nodiscard]] ConversionResult convertDocument(std::string_view raw);

// Reads `input`, converts, and atomically replaces `output`.
// Throws ConversionError; ErrorCode::Io for read/write failures.
ConversionResult convertFile(const std::filesystem::path& input,
                             const std::filesystem::path& output,
                             const ConvertOptions& opts = {});

} // namespace snmprec
