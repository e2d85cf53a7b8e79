// apps/bch_calc/main.cpp
#include <iostream>
#include <string>
#include <vector>
#include <cstdint>

#include <boost/program_options.hpp>

#include <symecc/version.h>
#include <symecc/bch/bch.h>
#include <symecc/bch/format_info.h>
#include <symecc/report/csv.h>

using namespace symecc;
namespace po = boost::program_options;

int main(int argc, char** argv) {
    std::uint64_t value = 0;
    unsigned value_bits = bch::k_format_value_bits;
    std::uint64_t poly = bch::k_format_poly;
    unsigned poly_bits = bch::k_format_poly_bits;
    std::string csv_path;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help")
        ("version,v", "Show version")
        ("value", po::value<std::uint64_t>(&value), "Value to protect")
        ("all", "Compute the remainder for every value of --value-bits width")
        ("value-bits", po::value<unsigned>(&value_bits)->default_value(value_bits), "Bit width of the value")
        ("poly", po::value<std::uint64_t>(&poly)->default_value(poly), "Generator polynomial")
        ("poly-bits", po::value<unsigned>(&poly_bits)->default_value(poly_bits), "Bit width of the polynomial")
        ("format-word", "Also print the masked 15-bit QR format word (default parameters only)")
        ("csv", po::value<std::string>(&csv_path), "Also write the results to a CSV file")
        ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const std::exception& e) {
        std::cerr << "arg error: " << e.what() << "\n\n" << desc << "\n";
        return 2;
    }

    if (vm.count("help")) {
        std::cout << "bch_calc " << symecc::version() << "\n" << desc << "\n";
        return 0;
    }
    if (vm.count("version")) {
        std::cout << symecc::version() << "\n";
        return 0;
    }
    const bool all = vm.count("all") != 0;
    if (all == (vm.count("value") != 0)) {
        std::cerr << "error: exactly one of --value or --all is required\n\n" << desc << "\n";
        return 2;
    }
    if (all && (value_bits == 0 || value_bits > 16)) {
        std::cerr << "error: --all supports --value-bits 1..16\n";
        return 2;
    }

    const bool want_word = vm.count("format-word") != 0;
    const bool default_params = value_bits == bch::k_format_value_bits &&
        poly == bch::k_format_poly && poly_bits == bch::k_format_poly_bits;
    if (want_word && !default_params) {
        std::cerr << "error: --format-word requires the default BCH(15,5) parameters\n";
        return 2;
    }

    report::CsvWriter w;
    if (want_word) w.set_header({ "value", "remainder", "format_word" });
    else w.set_header({ "value", "remainder" });

    const std::uint64_t first = all ? 0 : value;
    const std::uint64_t last = all ? ((std::uint64_t{ 1 } << value_bits) - 1) : value;

    try {
        for (std::uint64_t v = first; v <= last; ++v) {
            const std::uint64_t r = bch::remainder(v, value_bits, poly, poly_bits);
            std::cout << "value=" << v << ", remainder=" << r;
            std::vector<std::string> row{ std::to_string(v), std::to_string(r) };
            if (want_word) {
                const auto word = bch::format_word(static_cast<unsigned>(v));
                std::cout << ", format_word=" << word;
                row.push_back(std::to_string(word));
            }
            std::cout << "\n";
            w.add_row(row);
        }
    }
    catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 3;
    }

    if (vm.count("csv") && !w.save_to_file(csv_path)) {
        std::cerr << "error: cannot write " << csv_path << "\n";
        return 4;
    }
    return 0;
}
