#include <symecc/bch/bch.h>
#include <stdexcept>

namespace symecc::bch {

    std::uint64_t remainder(std::uint64_t v, unsigned vw, std::uint64_t p, unsigned pw) {
        if (vw == 0 || pw == 0) {
            throw std::invalid_argument("bch::remainder: bit widths must be positive");
        }
        if (pw <= vw) {
            throw std::invalid_argument("bch::remainder: polynomial width must exceed value width");
        }
        if (pw > 64 || std::uint64_t{ vw } + pw - 1 > 64) {
            throw std::invalid_argument("bch::remainder: vw + pw - 1 exceeds 64 bits");
        }
        if (vw < 64 && (v >> vw) != 0) {
            throw std::invalid_argument("bch::remainder: value wider than vw bits");
        }
        if ((p >> (pw - 1)) != 1) {
            throw std::invalid_argument("bch::remainder: polynomial top bit is not at pw-1");
        }

        v <<= (pw - 1);
        for (unsigned i = vw; i-- > 0;) {
            const std::uint64_t test = v ^ (p << i);
            if (test < v) v = test;
        }
        return v;
    }

} // namespace symecc::bch
