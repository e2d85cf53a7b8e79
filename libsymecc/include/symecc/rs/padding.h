#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace symecc::rs {

    // First pad codeword after the data.
    inline constexpr std::uint8_t k_pad_first = 129;

    // Pad codeword for 0-based codeword position `pos`.
    // first_pad: pos is the first position after the data (always 129).
    // Otherwise the 253-state randomised pad: p = ((149*(pos+1)) mod 253 + 130) mod 254,
    // with 0 mapped to 254.
    constexpr std::uint8_t pad_byte(std::size_t pos, bool first_pad) noexcept {
        if (first_pad) return k_pad_first;
        const std::size_t p = (((149 * (pos + 1)) % 253) + 130) % 254;
        return static_cast<std::uint8_t>(p == 0 ? 254 : p);
    }

    // Extends data to target_data_size codewords.
    // Throws std::invalid_argument if data is longer than target_data_size.
    std::vector<std::uint8_t> pad(std::span<const std::uint8_t> data, std::size_t target_data_size);

} // namespace symecc::rs
