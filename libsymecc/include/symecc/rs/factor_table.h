#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <span>
#include <vector>

namespace symecc::rs {

    // Coefficients of the monic generator polynomial Π (x + α^i), i = 1..ecc_size,
    // lowest degree first. The leading x^ecc_size coefficient (always 1) is not stored.
    using FactorTable = std::vector<std::uint8_t>;

    // General builder. Never consults the hard-coded tables.
    // Throws std::invalid_argument for ecc_size == 0.
    FactorTable build_factor_table(std::size_t ecc_size);

    // Precomputed tables for the ecc lengths of the single-block symbol sizes
    // (5, 7, 10, 11, 12, 14, 18, 20, 24, 28). Empty if ecc_size has none.
    std::optional<std::span<const std::uint8_t>> known_factor_table(std::size_t ecc_size) noexcept;

    // ecc lengths known_factor_table() answers for, ascending.
    std::span<const std::size_t> known_ecc_sizes() noexcept;

    // Per-instance memo of ecc_size -> factor table.
    // get() may be called from several threads at once. Tables are never evicted,
    // so returned references stay valid for the cache's lifetime.
    class FactorTableCache {
    public:
        // seed_known_tables: start with the precomputed tables already inserted.
        explicit FactorTableCache(bool seed_known_tables = true);

        FactorTableCache(const FactorTableCache&) = delete;
        FactorTableCache& operator=(const FactorTableCache&) = delete;

        // Table for ecc_size, building it on a miss.
        // Throws std::invalid_argument for ecc_size == 0.
        const FactorTable& get(std::size_t ecc_size);

        bool contains(std::size_t ecc_size) const;
        std::size_t size() const;

    private:
        mutable std::shared_mutex mu_;
        std::map<std::size_t, FactorTable> tables_;
    };

} // namespace symecc::rs
