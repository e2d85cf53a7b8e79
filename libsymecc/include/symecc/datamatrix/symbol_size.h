#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace symecc::datamatrix {

    enum class symbol_shape : std::uint8_t { square, rectangle };

    // One ECC 200 symbol size with a single Reed-Solomon block.
    struct SymbolSize {
        std::uint16_t rows{ 0 };
        std::uint16_t cols{ 0 };
        std::uint16_t data_size{ 0 }; // data + pad codewords
        std::uint16_t ecc_size{ 0 };  // ecc codewords

        symbol_shape shape() const noexcept {
            return rows == cols ? symbol_shape::square : symbol_shape::rectangle;
        }
        std::size_t total_size() const noexcept { return std::size_t{ data_size } + ecc_size; }

        // "RxC", e.g. "10x10".
        std::string name() const;

        friend bool operator==(const SymbolSize&, const SymbolSize&) = default;
    };

    // All supported sizes: squares first, then rectangles, each ascending by capacity.
    std::span<const SymbolSize> symbol_sizes() noexcept;

    // Lookup by "RxC" (case-insensitive 'x').
    std::optional<SymbolSize> find_symbol(std::string_view name) noexcept;

    // Smallest symbol holding data_len codewords. With allow_rectangular, rectangles
    // compete with squares on capacity (ties go to the square).
    std::optional<SymbolSize> smallest_symbol_for(std::size_t data_len, bool allow_rectangular = false) noexcept;

} // namespace symecc::datamatrix
