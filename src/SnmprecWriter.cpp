// SnmprecWriter.cpp – Staged, all-or-nothing snmprec output.

#include "SnmprecConv/SnmprecWriter.hpp"
#include "SnmprecConv/Oid.hpp"

#include <exception>
#include <fstream>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace snmprec {

namespace {

// Owns a temporary file and deletes it unless commit() renamed it away.
class StagedFile {
public:
    explicit StagedFile(fs::path path) : path_(std::move(path)) {}
    ~StagedFile() {
        if (!committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }
    StagedFile(const StagedFile&)            = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

    void commit(const fs::path& dest) {
        std::error_code ec;
        fs::rename(path_, dest, ec);
        if (ec)
            throw ConversionError(ErrorCode::Io,
                                  "cannot replace '" + dest.string() + "': " + ec.message());
        committed_ = true;
    }

private:
    fs::path path_;
    bool     committed_{false};
};

} // namespace

// "<name>.tmp-<16 hex digits>" beside the destination.
static fs::path stagingPath(const fs::path& dest) {
    std::random_device rd;
    std::mt19937_64    gen{(static_cast<uint64_t>(rd()) << 32) ^ rd()};

    fs::path dir = dest.parent_path();
    for (int attempt = 0; attempt < 16; ++attempt) {
        uint64_t r = gen();
        static constexpr char kDigits[] = "0123456789abcdef";
        std::string suffix = ".tmp-";
        for (int i = 60; i >= 0; i -= 4)
            suffix += kDigits[(r >> i) & 0x0F];

        fs::path candidate = dir / (dest.filename().string() + suffix);
        std::error_code ec;
        if (!fs::exists(candidate, ec) && !ec)
            return candidate;
    }
    throw ConversionError(ErrorCode::Io,
                          "cannot choose a temporary file name beside '" + dest.string() + "'");
}

std::string formatLine(const EncodedRecord& rec) {
    std::string line = formatOid(rec.oid);
    line += kFieldSeparator;
    line += std::to_string(rec.tag);
    line += kFieldSeparator;
    line += rec.value;
    line += '\n';
    return line;
}

void writeSnmprec(const fs::path& dest,
                  const std::vector<EncodedRecord>& records,
                  const WriteOptions& opts) {
    if (dest.empty() || !dest.has_filename())
        throw ConversionError(ErrorCode::Io, "output path '" + dest.string() + "' names no file");

    StagedFile staged(stagingPath(dest));

    std::ofstream out(staged.path(), std::ios::binary | std::ios::trunc);
    if (!out)
        throw ConversionError(ErrorCode::Io,
                              "cannot create temporary file '" + staged.path().string() + "'");

    size_t written = 0;
    for (const auto& rec : records) {
        const std::string line = formatLine(rec);
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        if (!out)
            throw ConversionError(ErrorCode::Io,
                                  "write to '" + staged.path().string() + "' failed after " +
                                  std::to_string(written) + " records");
        ++written;
        if (opts.progress) {
            try {
                opts.progress(written);
            } catch (const std::exception& e) {
                throw ConversionError(ErrorCode::Io,
                                      "write to '" + dest.string() + "' aborted after " +
                                      std::to_string(written) + " records: " + e.what());
            }
        }
    }

    out.close();
    if (out.fail())
        throw ConversionError(ErrorCode::Io,
                              "cannot flush temporary file '" + staged.path().string() + "'");

    staged.commit(dest);
}

} // namespace snmprec
