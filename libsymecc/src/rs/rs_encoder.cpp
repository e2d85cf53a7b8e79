#include <symecc/rs/rs_encoder.h>
#include <symecc/gf/gf256.h>
#include <algorithm>
#include <stdexcept>

namespace symecc::rs {

    void encode_into(std::span<const std::uint8_t> codeword,
        std::span<const std::uint8_t> factors,
        std::span<std::uint8_t> out)
    {
        if (codeword.empty()) {
            throw std::invalid_argument("rs::encode: empty codeword");
        }
        if (factors.empty()) {
            throw std::invalid_argument("rs::encode: empty factor table");
        }
        if (out.size() != factors.size()) {
            throw std::invalid_argument("rs::encode: output size does not match factor table");
        }

        const std::size_t n = factors.size();

        // Two generations of the remainder register. For every input byte:
        //   next[j] = t * g[n-1-j] ^ prev[j+1]   (j < n-1)
        //   next[n-1] = t * g[0]
        // i.e. shift left by one position and add t times the generator.
        std::vector<std::uint8_t> prev(n, 0);
        std::vector<std::uint8_t> next(n, 0);

        for (const std::uint8_t d : codeword) {
            const auto t = static_cast<std::uint8_t>(d ^ prev[0]);
            for (std::size_t j = 0; j < n; ++j) {
                next[j] = gf::multiply(t, factors[n - 1 - j]);
                if (j + 1 < n) next[j] ^= prev[j + 1];
            }
            prev.swap(next);
        }

        std::copy(prev.begin(), prev.end(), out.begin());
    }

    std::vector<std::uint8_t> encode(std::span<const std::uint8_t> codeword,
        std::span<const std::uint8_t> factors)
    {
        std::vector<std::uint8_t> ecc(factors.size());
        encode_into(codeword, factors, ecc);
        return ecc;
    }

    std::vector<std::uint8_t> append_ecc(std::span<const std::uint8_t> codeword,
        std::span<const std::uint8_t> factors)
    {
        std::vector<std::uint8_t> out(codeword.begin(), codeword.end());
        out.resize(codeword.size() + factors.size());
        encode_into(codeword, factors,
            std::span<std::uint8_t>(out.data() + codeword.size(), factors.size()));
        return out;
    }

} // namespace symecc::rs
