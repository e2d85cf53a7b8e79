#pragma once
#include <array>
#include <cstdint>

// QR-style 15-bit format information: 5 value bits protected by BCH(15,5).
namespace symecc::bch {

    inline constexpr std::uint64_t k_format_poly = 1335; // x^10+x^8+x^5+x^4+x^2+x+1
    inline constexpr unsigned k_format_value_bits = 5;
    inline constexpr unsigned k_format_poly_bits = 11;
    inline constexpr std::uint16_t k_format_mask = 0x5412;
    inline constexpr unsigned k_format_values = 1u << k_format_value_bits;

    enum class ec_level : std::uint8_t { L, M, Q, H };

    // 10-bit BCH remainder of a 5-bit format value. Throws std::invalid_argument if value > 31.
    std::uint16_t format_remainder(unsigned value);

    // Remainders for every format value 0..31, computed once.
    const std::array<std::uint16_t, k_format_values>& format_remainder_table();

    // ((value << 10) | remainder) ^ 0x5412. Throws std::invalid_argument if value > 31.
    std::uint16_t format_word(unsigned value);

    // Packs EC level indicator bits (L=01, M=00, Q=11, H=10) and mask pattern 0..7.
    // Throws std::invalid_argument if mask_pattern > 7.
    unsigned make_format_value(ec_level level, unsigned mask_pattern);

} // namespace symecc::bch
