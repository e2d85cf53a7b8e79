#include <symecc/datamatrix/symbol_encoder.h>
#include <symecc/rs/padding.h>
#include <symecc/rs/rs_encoder.h>
#include <stdexcept>
#include <string>

namespace symecc::datamatrix {

    std::vector<std::uint8_t> SymbolCodewords::full() const {
        std::vector<std::uint8_t> out;
        out.reserve(data.size() + pad.size() + ecc.size());
        out.insert(out.end(), data.begin(), data.end());
        out.insert(out.end(), pad.begin(), pad.end());
        out.insert(out.end(), ecc.begin(), ecc.end());
        return out;
    }

    SymbolCodewords SymbolEncoder::encode(std::span<const std::uint8_t> data, const SymbolSize& symbol) const {
        if (data.empty()) {
            throw std::invalid_argument("datamatrix::SymbolEncoder: no data codewords");
        }
        if (data.size() > symbol.data_size) {
            throw std::invalid_argument("datamatrix::SymbolEncoder: " + std::to_string(data.size()) +
                " codewords do not fit " + symbol.name() + " (capacity " +
                std::to_string(symbol.data_size) + ")");
        }

        const auto padded = rs::pad(data, symbol.data_size);
        const auto& factors = cache_.get(symbol.ecc_size);

        SymbolCodewords out;
        out.symbol = symbol;
        out.data.assign(data.begin(), data.end());
        out.pad.assign(padded.begin() + static_cast<std::ptrdiff_t>(data.size()), padded.end());
        out.ecc = rs::encode(padded, factors);
        return out;
    }

    SymbolCodewords SymbolEncoder::encode_auto(std::span<const std::uint8_t> data) const {
        if (data.empty()) {
            throw std::invalid_argument("datamatrix::SymbolEncoder: no data codewords");
        }
        const auto symbol = smallest_symbol_for(data.size(), cfg_.allow_rectangular);
        if (!symbol) {
            throw std::invalid_argument("datamatrix::SymbolEncoder: " + std::to_string(data.size()) +
                " codewords exceed the largest supported symbol");
        }
        return encode(data, *symbol);
    }

} // namespace symecc::datamatrix
