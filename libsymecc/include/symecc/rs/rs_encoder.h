#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Reed-Solomon ECC generation over GF(2^8) (encode side only).
namespace symecc::rs {

    // Computes factors.size() ecc codewords for `codeword` by synthetic division
    // by the generator polynomial whose low-order coefficients are `factors`.
    // Output is in transmission (forward) order.
    // Throws std::invalid_argument if codeword or factors is empty.
    std::vector<std::uint8_t> encode(std::span<const std::uint8_t> codeword,
        std::span<const std::uint8_t> factors);

    // Same as encode(), writing into `out`, which must hold exactly factors.size() bytes.
    void encode_into(std::span<const std::uint8_t> codeword,
        std::span<const std::uint8_t> factors,
        std::span<std::uint8_t> out);

    // codeword followed by its ecc codewords.
    std::vector<std::uint8_t> append_ecc(std::span<const std::uint8_t> codeword,
        std::span<const std::uint8_t> factors);

} // namespace symecc::rs
