#include <symecc/rs/padding.h>
#include <stdexcept>
#include <string>

namespace symecc::rs {

    std::vector<std::uint8_t> pad(std::span<const std::uint8_t> data, std::size_t target_data_size) {
        if (data.size() > target_data_size) {
            throw std::invalid_argument("rs::pad: data length " + std::to_string(data.size()) +
                " exceeds target size " + std::to_string(target_data_size));
        }

        std::vector<std::uint8_t> out;
        out.reserve(target_data_size);
        out.assign(data.begin(), data.end());

        const std::size_t pad_start = data.size();
        for (std::size_t i = pad_start; i < target_data_size; ++i) {
            out.push_back(pad_byte(i, i == pad_start));
        }
        return out;
    }

} // namespace symecc::rs
