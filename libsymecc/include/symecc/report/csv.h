#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace symecc::report {

    // Simple in-memory CSV builder for encoder results.
    // Usage:
    //   CsvWriter w;
    //   w.set_header({"symbol","data","pad","ecc"});
    //   w.add_row({"10x10", "142 164 186", "", "114 25 5 88 102"});
    //   auto csv = w.str();
    class CsvWriter {
    public:
        // Column names. May be called once, before any add_row().
        void set_header(std::vector<std::string> columns);

        // Append one data row (same size as header()).
        void add_row(const std::vector<std::string>& fields);

        const std::string& str() const noexcept { return buf_; }
        const std::vector<std::string>& header() const noexcept { return header_; }
        std::size_t rows() const noexcept { return rows_; }

        // Save CSV buffer to a file path. Overwrites existing file.
        // Returns true on success.
        bool save_to_file(const std::string& filepath) const;

    private:
        static void append_field_csv(std::string& out, std::string_view field);
        static void append_row_csv(std::string& out, const std::vector<std::string>& fields);

        std::vector<std::string> header_;
        std::string buf_;
        std::size_t rows_{ 0 };
    };

    // "142 164 186"
    std::string join_decimal(std::span<const std::uint8_t> bytes, char sep = ' ');
    // "8e a4 ba"
    std::string join_hex(std::span<const std::uint8_t> bytes, char sep = ' ');

} // namespace symecc::report
