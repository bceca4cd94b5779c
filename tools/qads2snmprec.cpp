// qads2snmprec.cpp – Converts a QA Device Simulator capture (XML) into an
// snmprec file for the SNMP simulator.
//
//   qads2snmprec -i capture.xml -o data/device.snmprec
//   qads2snmprec -i capture.xml -o out.snmprec --keep-sanitized capture_updated.xml -v

#include "SnmprecConv/Converter.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

namespace po = boost::program_options;

static constexpr size_t kProgressInterval = 10000;

int main(int argc, char* argv[]) {
    std::string input;
    std::string output;
    std::string sanitized;

    po::options_description opts("Allowed options");
    opts.add_options()
        ("help,h", "Show usage information")
        ("input,i", po::value<std::string>(&input)->required(),
            "Capture export (XML) taken with the QA Device Simulator")
        ("output,o", po::value<std::string>(&output)->required(),
            "snmprec file to create or replace")
        ("keep-sanitized", po::value<std::string>(&sanitized),
            "Also write the sanitized XML to this path")
        ("verbose,v", "Enable debug logging");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, opts), vm);
        if (vm.count("help")) {
            std::cout << opts << '\n';
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n\n" << opts << '\n';
        return 2;
    }

    if (vm.count("verbose"))
        spdlog::set_level(spdlog::level::debug);

    snmprec::ConvertOptions copts;
    if (!sanitized.empty())
        copts.sanitized_copy = sanitized;
    copts.write.progress = [](size_t written) {
        if (written % kProgressInterval == 0)
            spdlog::debug("{} records written", written);
    };

    spdlog::info("Converting {} -> {}", input, output);
    try {
        auto result = snmprec::convertFile(input, output, copts);

        if (copts.sanitized_copy)
            spdlog::debug("Sanitized copy written to {}", sanitized);
        if (result.escapes > 0)
            spdlog::debug("{} disallowed character references escaped", result.escapes);
        spdlog::info("{} definitions read, {} skipped, {} records written to {}",
                     result.definitions, result.skipped, result.records.size(), output);
    } catch (const snmprec::ConversionError& e) {
        spdlog::error("Conversion failed: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected failure: {}", e.what());
        return 1;
    }
    return 0;
}
