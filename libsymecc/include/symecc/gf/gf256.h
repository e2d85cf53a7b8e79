#pragma once
#include <cstddef>
#include <cstdint>

// GF(2^8) arithmetic for Data Matrix ECC 200.
// Field polynomial x^8 + x^5 + x^3 + x^2 + 1 (301, 0x12D), generator α=2.
namespace symecc::gf {

    inline constexpr std::uint16_t k_field_poly = 0x12D;
    inline constexpr std::uint8_t k_generator = 2;
    inline constexpr unsigned k_order = 255; // multiplicative group order

    // Addition and subtraction are both XOR.
    inline constexpr std::uint8_t add(std::uint8_t a, std::uint8_t b) noexcept {
        return static_cast<std::uint8_t>(a ^ b);
    }

    // a*b; zero if either operand is zero.
    std::uint8_t multiply(std::uint8_t a, std::uint8_t b) noexcept;

    // a^n. power(a, 0) == 1 for every a, including 0.
    std::uint8_t power(std::uint8_t a, unsigned n) noexcept;

    // Discrete log of a non-zero element, in [0..254].
    // Throws std::invalid_argument for a == 0.
    unsigned discrete_log(std::uint8_t a);

    // α^e, e reduced mod 255.
    std::uint8_t antilog(unsigned e) noexcept;

    // Range-checked conversion of a caller integer into a field element.
    // Throws std::invalid_argument if v > 255.
    std::uint8_t to_element(unsigned v);

} // namespace symecc::gf
