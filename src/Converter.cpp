// Converter.cpp – Runs the conversion stages in order.

#include "SnmprecConv/Converter.hpp"
#include "SnmprecConv/DefinitionLoader.hpp"
#include "SnmprecConv/RecordSorter.hpp"
#include "SnmprecConv/Sanitizer.hpp"
#include "SnmprecConv/ValueEncoder.hpp"

#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace snmprec {

static ConversionResult runPipeline(const SanitizedDocument& doc) {
    ConversionResult result;
    result.escapes = doc.escapes.size();

    std::vector<DefinitionRecord> defs = loadDefinitions(doc);
    result.definitions = defs.size();

    std::vector<EncodedRecord> encoded;
    encoded.reserve(defs.size());
    for (const auto& def : defs) {
        if (def.skip) {
            ++result.skipped;
            continue;
        }
        encoded.push_back(encodeRecord(def));
    }

    result.records = sortRecords(std::move(encoded));
    return result;
}

ConversionResult convertDocument(std::string_view raw) {
    return runPipeline(sanitize(raw));
}

static std::string readAll(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw ConversionError(ErrorCode::Io, "cannot open '" + path.string() + "'");
    std::string data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
        throw ConversionError(ErrorCode::Io, "read error on '" + path.string() + "'");
    return data;
}

static void writeAll(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    if (out.fail())
        throw ConversionError(ErrorCode::Io, "cannot write '" + path.string() + "'");
}

static bool samePath(const fs::path& a, const fs::path& b) {
    std::error_code ec_a, ec_b;
    fs::path ca = fs::weakly_canonical(a, ec_a);
    fs::path cb = fs::weakly_canonical(b, ec_b);
    if (ec_a || ec_b)
        return a.lexically_normal() == b.lexically_normal();
    return ca == cb;
}

ConversionResult convertFile(const fs::path& input,
                             const fs::path& output,
                             const ConvertOptions& opts) {
    if (opts.sanitized_copy && samePath(*opts.sanitized_copy, output))
        throw ConversionError(ErrorCode::Io,
                              "sanitized copy '" + opts.sanitized_copy->string() +
                              "' would overwrite the output file");

    const std::string raw = readAll(input);
    SanitizedDocument doc = sanitize(raw);

    if (opts.sanitized_copy)
        writeAll(*opts.sanitized_copy, doc.text);

    ConversionResult result = runPipeline(doc);
    writeSnmprec(output, result.records, opts.write);
    return result;
}

} // namespace snmprec
