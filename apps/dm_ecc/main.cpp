// apps/dm_ecc/main.cpp
#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <charconv>
#include <stdexcept>
#include <cstdint>

#include <boost/program_options.hpp>

#include <symecc/version.h>
#include <symecc/gf/gf256.h>
#include <symecc/rs/factor_table.h>
#include <symecc/rs/padding.h>
#include <symecc/rs/rs_encoder.h>
#include <symecc/datamatrix/ascii_encoder.h>
#include <symecc/datamatrix/symbol_encoder.h>
#include <symecc/report/csv.h>

using namespace symecc;
namespace po = boost::program_options;

// "142,164,186" or "142 164 186" -> codewords. Throws std::invalid_argument.
static std::vector<std::uint8_t> parse_bytes(std::string_view s) {
    std::vector<std::uint8_t> out;
    std::size_t i = 0;
    while (i < s.size()) {
        if (s[i] == ',' || s[i] == ' ' || s[i] == '\t') { ++i; continue; }
        unsigned v = 0;
        auto [ptr, ec] = std::from_chars(s.data() + i, s.data() + s.size(), v);
        if (ec != std::errc{}) {
            throw std::invalid_argument("cannot parse codeword near '" + std::string(s.substr(i)) + "'");
        }
        out.push_back(gf::to_element(v));
        i = static_cast<std::size_t>(ptr - s.data());
    }
    return out;
}

static std::string fmt(const std::vector<std::uint8_t>& b, bool hex) {
    return hex ? report::join_hex(b) : report::join_decimal(b);
}

int main(int argc, char** argv) {
    std::string symbol_s = "auto";
    std::string text;
    std::string bytes_s;
    std::string csv_path;
    int data_size = 0;
    int ecc_size = 0;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help")
        ("version,v", "Show version")
        ("symbol", po::value<std::string>(&symbol_s)->default_value(symbol_s), "Symbol size RxC (e.g. 12x12) or 'auto'")
        ("text", po::value<std::string>(&text), "Payload text, ASCII-encoded")
        ("bytes", po::value<std::string>(&bytes_s), "Payload as raw codewords, e.g. \"142,164,186\"")
        ("data-size", po::value<int>(&data_size)->default_value(0), "Override data capacity (requires --ecc-size)")
        ("ecc-size", po::value<int>(&ecc_size)->default_value(0), "Override ecc length (requires --data-size)")
        ("rect", "Allow rectangular symbols with --symbol auto")
        ("hex", "Print codewords in hex")
        ("csv", po::value<std::string>(&csv_path), "Also write the result to a CSV file")
        ("verbose", "Print intermediate values to stderr")
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
        std::cout << "dm_ecc " << symecc::version() << "\n" << desc << "\n";
        return 0;
    }
    if (vm.count("version")) {
        std::cout << symecc::version() << "\n";
        return 0;
    }
    if (vm.count("text") == vm.count("bytes")) {
        std::cerr << "error: exactly one of --text or --bytes is required\n\n" << desc << "\n";
        return 2;
    }
    const bool custom = data_size != 0 || ecc_size != 0;
    if (custom && (data_size <= 0 || ecc_size <= 0)) {
        std::cerr << "error: --data-size and --ecc-size must both be positive\n";
        return 2;
    }
    if (custom && !vm["symbol"].defaulted()) {
        std::cerr << "error: --symbol cannot be combined with --data-size/--ecc-size\n";
        return 2;
    }

    const bool hex = vm.count("hex") != 0;
    const bool verbose = vm.count("verbose") != 0;

    std::vector<std::uint8_t> data;
    try {
        data = vm.count("text") ? datamatrix::ascii_encode(text) : parse_bytes(bytes_s);
    }
    catch (const std::exception& e) {
        std::cerr << "error: --bytes: " << e.what() << "\n";
        return 2;
    }
    if (data.empty()) {
        std::cerr << "error: payload is empty\n";
        return 2;
    }

    rs::FactorTableCache cache;
    datamatrix::SymbolCodewords cw;
    std::string symbol_name;

    try {
        if (custom) {
            const auto padded = rs::pad(data, static_cast<std::size_t>(data_size));
            cw.data = data;
            cw.pad.assign(padded.begin() + static_cast<std::ptrdiff_t>(data.size()), padded.end());
            cw.ecc = rs::encode(padded, cache.get(static_cast<std::size_t>(ecc_size)));
            symbol_name = "custom";
        }
        else {
            datamatrix::SymbolEncoder enc(cache, { .allow_rectangular = vm.count("rect") != 0 });
            if (symbol_s == "auto") {
                cw = enc.encode_auto(data);
            }
            else {
                const auto symbol = datamatrix::find_symbol(symbol_s);
                if (!symbol) {
                    std::cerr << "error: unknown symbol size '" << symbol_s << "'\n";
                    return 2;
                }
                cw = enc.encode(data, *symbol);
            }
            symbol_name = cw.symbol.name();
        }
    }
    catch (const std::exception& e) {
        std::cerr << "encode error: " << e.what() << "\n";
        return 3;
    }

    if (verbose) {
        const std::size_t n = cw.ecc.size();
        std::cerr << "symbol: " << symbol_name
            << " (data " << cw.data.size() + cw.pad.size() << ", ecc " << n << ")\n";
        std::cerr << "generator factors: " << fmt(cache.get(n), hex) << "\n";
    }

    std::cout << "symbol: " << symbol_name << "\n";
    std::cout << "data:   " << fmt(cw.data, hex) << "\n";
    std::cout << "pad:    " << fmt(cw.pad, hex) << "\n";
    std::cout << "ecc:    " << fmt(cw.ecc, hex) << "\n";

    if (vm.count("csv")) {
        report::CsvWriter w;
        w.set_header({ "symbol", "data", "pad", "ecc" });
        w.add_row({ symbol_name, fmt(cw.data, hex), fmt(cw.pad, hex), fmt(cw.ecc, hex) });
        if (!w.save_to_file(csv_path)) {
            std::cerr << "error: cannot write " << csv_path << "\n";
            return 4;
        }
    }
    return 0;
}
