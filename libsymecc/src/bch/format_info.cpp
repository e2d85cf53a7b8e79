#include <symecc/bch/format_info.h>
#include <symecc/bch/bch.h>
#include <stdexcept>
#include <string>

namespace symecc::bch {

    namespace {

        void check_value(unsigned value, const char* what) {
            if (value >= k_format_values) {
                throw std::invalid_argument(std::string(what) + ": format value must be in [0,31]");
            }
        }

    } // namespace

    std::uint16_t format_remainder(unsigned value) {
        check_value(value, "bch::format_remainder");
        return static_cast<std::uint16_t>(
            remainder(value, k_format_value_bits, k_format_poly, k_format_poly_bits));
    }

    const std::array<std::uint16_t, k_format_values>& format_remainder_table() {
        static const auto table = [] {
            std::array<std::uint16_t, k_format_values> t{};
            for (unsigned v = 0; v < k_format_values; ++v) t[v] = format_remainder(v);
            return t;
        }();
        return table;
    }

    std::uint16_t format_word(unsigned value) {
        check_value(value, "bch::format_word");
        const unsigned word = (value << (k_format_poly_bits - 1)) | format_remainder_table()[value];
        return static_cast<std::uint16_t>(word ^ k_format_mask);
    }

    unsigned make_format_value(ec_level level, unsigned mask_pattern) {
        if (mask_pattern > 7) {
            throw std::invalid_argument("bch::make_format_value: mask pattern must be in [0,7]");
        }
        unsigned bits = 0;
        switch (level) {
        case ec_level::L: bits = 0b01; break;
        case ec_level::M: bits = 0b00; break;
        case ec_level::Q: bits = 0b11; break;
        case ec_level::H: bits = 0b10; break;
        }
        return (bits << 3) | mask_pattern;
    }

} // namespace symecc::bch
