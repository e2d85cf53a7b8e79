#include <symecc/gf/gf256.h>
#include <array>
#include <stdexcept>
#include <string>

namespace symecc::gf {

    namespace {

        // exp[i] = α^i for i in [0..509]; log[x] = i such that α^i = x (for x != 0).
        // exp is doubled so log[a] + log[b] indexes without a modulo.
        struct GfTables {
            std::array<std::uint8_t, 2 * k_order> exp{};
            std::array<std::uint8_t, 256> log{}; // log[0] unused

            GfTables() {
                std::uint16_t x = 1;
                for (unsigned i = 0; i < k_order; ++i) {
                    exp[i] = static_cast<std::uint8_t>(x);
                    log[exp[i]] = static_cast<std::uint8_t>(i);
                    x <<= 1;
                    if (x & 0x100) x ^= k_field_poly;
                }
                for (unsigned i = k_order; i < exp.size(); ++i) {
                    exp[i] = exp[i - k_order];
                }
            }
        };

        // Built once on first use (thread-safe static init).
        const GfTables& tables() {
            static const GfTables T;
            return T;
        }

    } // namespace

    std::uint8_t multiply(std::uint8_t a, std::uint8_t b) noexcept {
        if (a == 0 || b == 0) return 0;
        const auto& T = tables();
        return T.exp[T.log[a] + T.log[b]];
    }

    std::uint8_t power(std::uint8_t a, unsigned n) noexcept {
        if (n == 0) return 1;
        if (n == 1) return a;
        // Square-and-multiply; same result as n-1 repeated multiplications.
        std::uint8_t result = 1;
        std::uint8_t base = a;
        while (n) {
            if (n & 1u) result = multiply(result, base);
            base = multiply(base, base);
            n >>= 1;
        }
        return result;
    }

    unsigned discrete_log(std::uint8_t a) {
        if (a == 0) {
            throw std::invalid_argument("gf::discrete_log: zero has no logarithm");
        }
        return tables().log[a];
    }

    std::uint8_t antilog(unsigned e) noexcept {
        return tables().exp[e % k_order];
    }

    std::uint8_t to_element(unsigned v) {
        if (v > 255u) {
            throw std::invalid_argument("gf::to_element: " + std::to_string(v) + " is outside [0,255]");
        }
        return static_cast<std::uint8_t>(v);
    }

} // namespace symecc::gf
