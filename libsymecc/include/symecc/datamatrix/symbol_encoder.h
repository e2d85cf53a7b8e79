#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include <symecc/datamatrix/symbol_size.h>
#include <symecc/rs/factor_table.h>

namespace symecc::datamatrix {

    struct SymbolEncoderConfig {
        // encode_auto(): let rectangles compete with squares.
        bool allow_rectangular{ false };
    };

    // Encoded codewords of one symbol, split by role.
    struct SymbolCodewords {
        SymbolSize symbol{};
        std::vector<std::uint8_t> data; // caller codewords
        std::vector<std::uint8_t> pad;  // pad codewords up to symbol.data_size
        std::vector<std::uint8_t> ecc;  // symbol.ecc_size codewords

        // data + pad + ecc, the order they are placed in the symbol.
        std::vector<std::uint8_t> full() const;
    };

    // Pads data to a symbol's capacity and appends its Reed-Solomon ecc.
    // Factor tables come from the supplied cache, which must outlive the encoder.
    class SymbolEncoder {
    public:
        explicit SymbolEncoder(rs::FactorTableCache& cache, SymbolEncoderConfig cfg = {})
            : cache_(cache), cfg_(cfg) {}

        // Throws std::invalid_argument if data is empty or exceeds symbol.data_size.
        SymbolCodewords encode(std::span<const std::uint8_t> data, const SymbolSize& symbol) const;

        // Smallest fitting symbol (see SymbolEncoderConfig).
        // Throws std::invalid_argument if data is empty or fits no supported symbol.
        SymbolCodewords encode_auto(std::span<const std::uint8_t> data) const;

        const SymbolEncoderConfig& config() const noexcept { return cfg_; }

    private:
        rs::FactorTableCache& cache_;
        SymbolEncoderConfig cfg_;
    };

} // namespace symecc::datamatrix
