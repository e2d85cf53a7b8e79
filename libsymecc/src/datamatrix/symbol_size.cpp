#include <symecc/datamatrix/symbol_size.h>
#include <array>
#include <charconv>

namespace symecc::datamatrix {

    namespace {

        constexpr std::array<SymbolSize, 15> k_sizes{ {
            // squares
            { 10, 10, 3, 5 },
            { 12, 12, 5, 7 },
            { 14, 14, 8, 10 },
            { 16, 16, 12, 12 },
            { 18, 18, 18, 14 },
            { 20, 20, 22, 18 },
            { 22, 22, 30, 20 },
            { 24, 24, 36, 24 },
            { 26, 26, 44, 28 },
            // rectangles
            { 8, 18, 5, 7 },
            { 8, 32, 10, 11 },
            { 12, 26, 16, 14 },
            { 12, 36, 22, 18 },
            { 16, 36, 32, 24 },
            { 16, 48, 49, 28 },
        } };

        bool parse_dim(std::string_view s, std::uint16_t& out) noexcept {
            if (s.empty()) return false;
            const auto* first = s.data();
            const auto* last = s.data() + s.size();
            auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc{} && ptr == last;
        }

    } // namespace

    std::string SymbolSize::name() const {
        return std::to_string(rows) + "x" + std::to_string(cols);
    }

    std::span<const SymbolSize> symbol_sizes() noexcept {
        return k_sizes;
    }

    std::optional<SymbolSize> find_symbol(std::string_view name) noexcept {
        const auto sep = name.find_first_of("xX");
        if (sep == std::string_view::npos) return std::nullopt;

        std::uint16_t rows = 0, cols = 0;
        if (!parse_dim(name.substr(0, sep), rows) || !parse_dim(name.substr(sep + 1), cols)) {
            return std::nullopt;
        }
        for (const auto& s : k_sizes) {
            if (s.rows == rows && s.cols == cols) return s;
        }
        return std::nullopt;
    }

    std::optional<SymbolSize> smallest_symbol_for(std::size_t data_len, bool allow_rectangular) noexcept {
        std::optional<SymbolSize> best;
        for (const auto& s : k_sizes) {
            if (!allow_rectangular && s.shape() != symbol_shape::square) continue;
            if (s.data_size < data_len) continue;
            // Strict < keeps the earlier (square) entry on ties.
            if (!best || s.data_size < best->data_size) best = s;
        }
        return best;
    }

} // namespace symecc::datamatrix
