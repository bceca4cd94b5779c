#pragma once
// SnmprecWriter.hpp – Writes encoded records as an snmprec file.
//
// File format: one "<oid>|<tag>|<value>\n" line per record, no header.
// The destination is replaced atomically: lines go to a temporary file in
// the destination directory, which is renamed over the destination only
// after every line was written and the stream closed cleanly.

#include "Types.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace snmprec {

inline constexpr char kFieldSeparator = '|';

struct WriteOptions {
    // Invoked after each record with the number of records written so far.
    // An exception thrown here aborts the write with ConversionError(Io)
    // carrying its message; the destination is untouched.
    std::function<void(size_t)> progress;
};

[[nodiscard]] std::string formatLine(const EncodedRecord& rec);

// Throws ConversionError(Io) if the temporary file cannot be created or
// written, the progress callback throws, or the final rename fails.
void writeSnmprec(const std::filesystem::path& dest,
                  const std::vector<EncodedRecord>& records,
                  const WriteOptions& opts = {});

} // namespace snmprec
