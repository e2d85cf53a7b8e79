#pragma once
#include <cstdint>
#include <string_view>
#include <vector>

namespace symecc::datamatrix {

    inline constexpr std::uint8_t k_upper_shift = 235;
    inline constexpr std::uint8_t k_digit_pair_base = 130;

    // ASCII encodation:
    //   two consecutive digits "dd" -> 130 + dd
    //   byte 0..127                 -> byte + 1
    //   byte 128..255               -> 235 (upper shift), byte - 127
    std::vector<std::uint8_t> ascii_encode(std::string_view text);

} // namespace symecc::datamatrix
