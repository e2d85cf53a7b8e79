#pragma once
#include <cstdint>

namespace symecc::bch {

    // Remainder of (v << (pw-1)) divided by p over GF(2).
    //   v:  value, at most vw bits wide
    //   p:  generator polynomial, exactly pw bits wide (bit pw-1 set)
    // The result is narrower than pw-1 bits.
    //
    // Long division by XOR: at each step, subtracting p<<i leaves a smaller
    // number iff it cleared the current leading bit. That only holds because
    // v was shifted left by pw-1, so do not reuse the comparison for other layouts.
    //
    // Throws std::invalid_argument if vw or pw is 0, pw <= vw, vw+pw-1 > 64,
    // v does not fit in vw bits, or p is not pw bits wide.
    std::uint64_t remainder(std::uint64_t v, unsigned vw, std::uint64_t p, unsigned pw);

} // namespace symecc::bch
