#include <symecc/datamatrix/ascii_encoder.h>

namespace symecc::datamatrix {

    static inline bool is_digit(unsigned char c) noexcept {
        return c >= '0' && c <= '9';
    }

    std::vector<std::uint8_t> ascii_encode(std::string_view text) {
        std::vector<std::uint8_t> out;
        out.reserve(text.size());

        for (std::size_t i = 0; i < text.size(); ++i) {
            const auto c = static_cast<unsigned char>(text[i]);
            if (is_digit(c) && i + 1 < text.size() && is_digit(static_cast<unsigned char>(text[i + 1]))) {
                const unsigned pair = (c - '0') * 10u + (static_cast<unsigned char>(text[i + 1]) - '0');
                out.push_back(static_cast<std::uint8_t>(k_digit_pair_base + pair));
                ++i;
            }
            else if (c > 127) {
                out.push_back(k_upper_shift);
                out.push_back(static_cast<std::uint8_t>(c - 127));
            }
            else {
                out.push_back(static_cast<std::uint8_t>(c + 1));
            }
        }
        return out;
    }

} // namespace symecc::datamatrix
