// test_converter.cpp – End-to-end capture → snmprec conversion.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_converter [samples/qa_capture.xml]

#include "SnmprecConv/Converter.hpp"
#include "SnmprecConv/SnmprecWriter.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace snmprec;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

// ─── Utility ─────────────────────────────────────────────────────────────────

static std::string slurp(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

static void spit(const fs::path& p, const std::string& data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << data;
}

static std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    for (std::string l; std::getline(in, l);) out.push_back(l);
    return out;
}

// Files in `dir` other than the ones the test created itself.
static size_t strayFiles(const fs::path& dir, size_t expected) {
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(dir)) { (void)e; ++n; }
    return n > expected ? n - expected : 0;
}

static fs::path makeWorkDir() {
    std::random_device rd;
    fs::path dir = fs::temp_directory_path() /
                   ("snmprecconv-test-" + std::to_string(rd()) + std::to_string(rd()));
    fs::create_directories(dir);
    return dir;
}

template <typename Fn>
static bool throwsCode(Fn&& fn, ErrorCode code) {
    try {
        fn();
    } catch (const ConversionError& e) {
        return e.code() == code;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: the two-definition scenario
// ─────────────────────────────────────────────────────────────────────────────
static void testTwoDefinitions(const fs::path& dir) {
    std::cout << "\n=== Test: two-definition scenario ===\n";

    fs::path in  = dir / "two.xml";
    fs::path out = dir / "two.snmprec";
    spit(in,
         "<?xml version=\"1.0\"?>\n"
         "<Simulation><Definitions>\n"
         "  <Definition OID=\"1.3.6.1.2.1.1.2.0\" Type=\"Integer\" ReturnValue=\"42\"/>\n"
         "  <Definition OID=\"1.3.6.1.2.1.1.1.0\" Type=\"OctetString\" ReturnValue=\"&#x0;Linux\"/>\n"
         "</Definitions></Simulation>\n");

    ConversionResult result = convertFile(in, out);
    CHECK(result.definitions == 2, "two definitions");
    CHECK(result.escapes == 1,     "one escape");

    auto l = lines(slurp(out));
    CHECK(l.size() == 2, "exactly two lines");
    if (l.size() != 2) return;
    CHECK(l[0].rfind("1.3.6.1.2.1.1.1.0|4|00", 0) == 0, "first OID first, value starts with 00: " + l[0]);
    CHECK(l[0] == "1.3.6.1.2.1.1.1.0|4|004c696e7578",   "OctetString line");
    CHECK(l[1] == "1.3.6.1.2.1.1.2.0|2|42",             "Integer line");

    std::string text = slurp(out);
    CHECK(!text.empty() && text.back() == '\n' && text.find("\r") == std::string::npos,
          "newline-terminated lines");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: sample capture, full expected output
// ─────────────────────────────────────────────────────────────────────────────
static void testSampleCapture(const fs::path& dir, const fs::path& sample) {
    std::cout << "\n=== Test: sample capture ===\n";

    fs::path out       = dir / "sample.snmprec";
    fs::path sanitized = dir / "sample_updated.xml";

    ConvertOptions opts;
    opts.sanitized_copy = sanitized;
    ConversionResult result = convertFile(sample, out, opts);

    CHECK(result.definitions == 14,    "14 definitions");
    CHECK(result.skipped == 1,         "1 skipped");
    CHECK(result.records.size() == 13, "13 records");
    CHECK(result.escapes == 12,        "12 escapes");
    CHECK(fs::exists(sanitized),       "sanitized copy written");
    CHECK(slurp(sanitized).find("&#x0;") == std::string::npos, "sanitized copy has no &#x0;");

    const std::string expected =
        "1.3.6.1.2.1.1.1.0|4|001d4564676509526f75746572\n"
        "1.3.6.1.2.1.1.2.0|6|1.3.6.1.4.1.9.1.1208\n"
        "1.3.6.1.2.1.1.3.0|67|4294967295\n"
        "1.3.6.1.2.1.1.5.0|4|656467652d7274722d3031\n"
        "1.3.6.1.2.1.1.7.0|2|72\n"
        "1.3.6.1.2.1.2.2.1.5.9|66|1000000000\n"
        "1.3.6.1.2.1.2.2.1.6.9|4|001b2c030404\n"
        "1.3.6.1.2.1.2.2.1.6.10|4|001b2c030405\n"
        "1.3.6.1.2.1.2.2.1.10.9|65|0\n"
        "1.3.6.1.2.1.4.20.1.1.10.0.0.1|64|10.0.0.1\n"
        "1.3.6.1.2.1.31.1.1.1.6.9|70|18446744073709551615\n"
        "1.3.6.1.4.1.9.9.999.1.0|68|c29f78\n"
        "1.3.6.1.4.1.9.9.999.2.0|5|\n";
    std::string got = slurp(out);
    CHECK(got == expected, "sample output matches");
    if (got != expected)
        std::cerr << "--- got ---\n" << got << "--- expected ---\n" << expected;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: converting twice yields identical bytes
// ─────────────────────────────────────────────────────────────────────────────
static void testIdempotence(const fs::path& dir, const fs::path& sample) {
    std::cout << "\n=== Test: idempotence ===\n";

    fs::path a = dir / "a.snmprec";
    fs::path b = dir / "b.snmprec";
    convertFile(sample, a);
    convertFile(sample, b);
    std::string first = slurp(a);
    CHECK(!first.empty() && first == slurp(b), "two runs, identical output");

    convertFile(sample, a); // replace an existing destination
    CHECK(slurp(a) == first, "re-run over existing output unchanged");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: failures leave the destination untouched
// ─────────────────────────────────────────────────────────────────────────────
static void testFailuresKeepDestination(const fs::path& dir) {
    std::cout << "\n=== Test: failed conversions keep destination ===\n";

    fs::path out = dir / "kept.snmprec";
    const std::string previous = "1.3.6.1|4|6f6c64\n";
    spit(out, previous);

    fs::path bad_type = dir / "bad_type.xml";
    spit(bad_type,
         "<Simulation><Definitions>"
         "<Definition OID=\"1.3.6.1.2.1.1.1.0\" Type=\"OctetString\" ReturnValue=\"x\"/>"
         "<Definition OID=\"1.3.6.1.2.1.1.2.0\" Type=\"Float\" ReturnValue=\"1.5\"/>"
         "</Definitions></Simulation>");
    CHECK(throwsCode([&] { convertFile(bad_type, out); }, ErrorCode::UnrecognizedType),
          "Float -> UnrecognizedType");
    CHECK(slurp(out) == previous, "destination untouched after UnrecognizedType");

    fs::path dup = dir / "dup.xml";
    spit(dup,
         "<Simulation><Definitions>"
         "<Definition OID=\"1.3.6.1.2.1.1.1.0\" Type=\"OctetString\" ReturnValue=\"x\"/>"
         "<Definition OID=\"1.3.6.1.2.1.1.1.0\" Type=\"Integer\" ReturnValue=\"1\"/>"
         "</Definitions></Simulation>");
    CHECK(throwsCode([&] { convertFile(dup, out); }, ErrorCode::DuplicateOid),
          "duplicate -> DuplicateOid");
    CHECK(slurp(out) == previous, "destination untouched after DuplicateOid");

    fs::path fresh = dir / "never.snmprec";
    CHECK(throwsCode([&] { convertFile(dup, fresh); }, ErrorCode::DuplicateOid),
          "duplicate with no prior destination");
    CHECK(!fs::exists(fresh), "no destination created");

    CHECK(throwsCode([&] { convertFile(dir / "missing.xml", out); }, ErrorCode::Io),
          "missing input -> Io");
    CHECK(slurp(out) == previous, "destination untouched after Io");

    // A sanitized copy aimed at the destination itself is refused up front.
    ConvertOptions same;
    same.sanitized_copy = dir / "." / "kept.snmprec";
    CHECK(throwsCode([&] { convertFile(bad_type, out, same); }, ErrorCode::Io),
          "sanitized copy onto destination -> Io");
    CHECK(slurp(out) == previous, "destination untouched when the copy would overwrite it");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: a failure part-way through emission
// ─────────────────────────────────────────────────────────────────────────────
static void testInterruptedWrite(const fs::path& dir, const fs::path& sample) {
    std::cout << "\n=== Test: interrupted write ===\n";

    fs::path sub = dir / "interrupted";
    fs::create_directories(sub);
    fs::path out = sub / "device.snmprec";
    const std::string previous = "1.3.6.1|2|1\n";
    spit(out, previous);

    ConvertOptions opts;
    size_t calls = 0;
    opts.write.progress = [&](size_t written) {
        calls = written;
        if (written == 5)
            throw std::runtime_error("simulated disk failure");
    };

    std::string what;
    bool threw = false;
    try {
        convertFile(sample, out, opts);
    } catch (const ConversionError& e) {
        threw = e.code() == ErrorCode::Io;
        what  = e.what();
    }
    CHECK(threw,                   "write aborted with Io");
    CHECK(what.find("simulated disk failure") != std::string::npos, "cause kept: " + what);
    CHECK(calls == 5,              "aborted after five records");
    CHECK(slurp(out) == previous,  "destination keeps previous content");
    CHECK(strayFiles(sub, 1) == 0, "temporary file removed");

    fs::path fresh = sub / "fresh.snmprec";
    threw = throwsCode([&] { convertFile(sample, fresh, opts); }, ErrorCode::Io);
    CHECK(threw && !fs::exists(fresh), "no destination created by an aborted write");
    CHECK(strayFiles(sub, 1) == 0,     "no temporary file left");

    // Progress counts every record on success.
    size_t last = 0;
    WriteOptions wopts;
    wopts.progress = [&](size_t written) { last = written; };
    ConversionResult r = convertDocument(slurp(sample));
    writeSnmprec(fresh, r.records, wopts);
    CHECK(last == r.records.size(), "progress reaches record count");

    CHECK(throwsCode([&] { writeSnmprec(sub / "no-such-dir" / "x.snmprec", r.records); }, ErrorCode::Io),
          "unwritable location -> Io");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 6: formatLine
// ─────────────────────────────────────────────────────────────────────────────
static void testFormatLine() {
    std::cout << "\n=== Test: formatLine ===\n";

    EncodedRecord r;
    r.oid   = {1, 3, 6, 1, 2, 1, 1, 3, 0};
    r.tag   = 67;
    r.value = "123";
    CHECK(formatLine(r) == "1.3.6.1.2.1.1.3.0|67|123\n", "oid|tag|value\\n");

    r.tag   = 5;
    r.value = "";
    CHECK(formatLine(r) == "1.3.6.1.2.1.1.3.0|5|\n", "empty value keeps trailing separator");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    fs::path sample = (argc > 1)
        ? fs::path(argv[1])
        : fs::path(__FILE__).parent_path().parent_path() / "samples" / "qa_capture.xml";

    std::cout << "Using sample: " << sample << '\n';

    fs::path dir = makeWorkDir();
    try {
        testFormatLine();
        testTwoDefinitions(dir);
        testSampleCapture(dir, sample);
        testIdempotence(dir, sample);
        testFailuresKeepDestination(dir);
        testInterruptedWrite(dir, sample);
    } catch (const std::exception& e) {
        std::cerr << "FAIL unexpected exception: " << e.what() << '\n';
        ++failures;
    }

    std::error_code ec;
    fs::remove_all(dir, ec);

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
