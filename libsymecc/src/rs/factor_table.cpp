#include <symecc/rs/factor_table.h>
#include <symecc/gf/gf256.h>
#include <array>
#include <mutex>
#include <stdexcept>

namespace symecc::rs {

    namespace {

        constexpr std::array<std::uint8_t, 5> k_ecc5{ 228, 48, 15, 111, 62 };
        constexpr std::array<std::uint8_t, 7> k_ecc7{ 23, 68, 144, 134, 240, 92, 254 };
        constexpr std::array<std::uint8_t, 10> k_ecc10{ 28, 24, 185, 166, 223, 248, 116, 255, 110, 61 };
        constexpr std::array<std::uint8_t, 11> k_ecc11{ 175, 138, 205, 12, 194, 168, 39, 245, 60, 97, 120 };
        constexpr std::array<std::uint8_t, 12> k_ecc12{ 41, 153, 158, 91, 61, 42, 142, 213, 97, 178, 100, 242 };
        constexpr std::array<std::uint8_t, 14> k_ecc14{ 156, 97, 192, 252, 95, 9, 157, 119, 138, 45, 18, 186, 83, 185 };
        constexpr std::array<std::uint8_t, 18> k_ecc18{ 83, 195, 100, 39, 188, 75, 66, 61, 241, 213, 109, 129,
                                                        94, 254, 225, 48, 90, 188 };
        constexpr std::array<std::uint8_t, 20> k_ecc20{ 15, 195, 244, 9, 233, 71, 168, 2, 188, 160, 153, 145,
                                                        253, 79, 108, 82, 27, 174, 186, 172 };
        constexpr std::array<std::uint8_t, 24> k_ecc24{ 52, 190, 88, 205, 109, 39, 176, 21, 155, 197, 251, 223,
                                                        155, 21, 5, 172, 254, 124, 12, 181, 184, 96, 50, 193 };
        constexpr std::array<std::uint8_t, 28> k_ecc28{ 211, 231, 43, 97, 71, 96, 103, 174, 37, 151, 170, 53,
                                                        75, 34, 249, 121, 17, 138, 110, 213, 141, 136, 120, 151,
                                                        233, 168, 93, 255 };

        constexpr std::array<std::size_t, 10> k_known_sizes{ 5, 7, 10, 11, 12, 14, 18, 20, 24, 28 };

    } // namespace

    FactorTable build_factor_table(std::size_t ecc_size) {
        if (ecc_size == 0) {
            throw std::invalid_argument("rs::build_factor_table: ecc_size must be positive");
        }

        // Multiply the running product by (x + α^i) for i = 1..ecc_size.
        // Before step i the product has degree i-1 and its leading coefficient,
        // which would sit at f[i-1], is the implicit 1.
        FactorTable f(ecc_size, 0);
        for (std::size_t i = 1; i <= ecc_size; ++i) {
            const std::uint8_t root = gf::power(gf::k_generator, static_cast<unsigned>(i));
            for (std::size_t j = i; j-- > 0;) {
                f[j] = (j == i - 1) ? root : gf::multiply(f[j], root);
                if (j > 0) f[j] ^= f[j - 1];
            }
        }
        return f;
    }

    std::optional<std::span<const std::uint8_t>> known_factor_table(std::size_t ecc_size) noexcept {
        switch (ecc_size) {
        case 5:  return std::span<const std::uint8_t>(k_ecc5);
        case 7:  return std::span<const std::uint8_t>(k_ecc7);
        case 10: return std::span<const std::uint8_t>(k_ecc10);
        case 11: return std::span<const std::uint8_t>(k_ecc11);
        case 12: return std::span<const std::uint8_t>(k_ecc12);
        case 14: return std::span<const std::uint8_t>(k_ecc14);
        case 18: return std::span<const std::uint8_t>(k_ecc18);
        case 20: return std::span<const std::uint8_t>(k_ecc20);
        case 24: return std::span<const std::uint8_t>(k_ecc24);
        case 28: return std::span<const std::uint8_t>(k_ecc28);
        default: return std::nullopt;
        }
    }

    std::span<const std::size_t> known_ecc_sizes() noexcept {
        return k_known_sizes;
    }

    FactorTableCache::FactorTableCache(bool seed_known_tables) {
        if (!seed_known_tables) return;
        for (std::size_t n : k_known_sizes) {
            const auto t = known_factor_table(n);
            tables_.emplace(n, FactorTable(t->begin(), t->end()));
        }
    }

    const FactorTable& FactorTableCache::get(std::size_t ecc_size) {
        {
            std::shared_lock lock(mu_);
            auto it = tables_.find(ecc_size);
            if (it != tables_.end()) return it->second;
        }

        // Build outside the lock; if another thread inserted first, keep theirs.
        FactorTable built = build_factor_table(ecc_size);
        std::unique_lock lock(mu_);
        return tables_.try_emplace(ecc_size, std::move(built)).first->second;
    }

    bool FactorTableCache::contains(std::size_t ecc_size) const {
        std::shared_lock lock(mu_);
        return tables_.count(ecc_size) != 0;
    }

    std::size_t FactorTableCache::size() const {
        std::shared_lock lock(mu_);
        return tables_.size();
    }

} // namespace symecc::rs
