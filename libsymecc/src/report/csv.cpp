#include <symecc/report/csv.h>
#include <stdexcept>
#include <fstream>

namespace symecc::report {

    static inline bool needs_quotes(std::string_view s) {
        for (char c : s) {
            if (c == ',' || c == '"' || c == '\n' || c == '\r') return true;
        }
        return false;
    }

    void CsvWriter::append_field_csv(std::string& out, std::string_view field) {
        if (!needs_quotes(field)) {
            out.append(field);
            return;
        }
        out.push_back('"');
        for (char c : field) {
            if (c == '"') out.push_back('"'); // escape by doubling
            out.push_back(c);
        }
        out.push_back('"');
    }

    void CsvWriter::append_row_csv(std::string& out, const std::vector<std::string>& fields) {
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i) out.push_back(',');
            append_field_csv(out, fields[i]);
        }
        out.push_back('\n');
    }

    void CsvWriter::set_header(std::vector<std::string> columns) {
        if (!header_.empty()) {
            throw std::logic_error("CsvWriter: header already set");
        }
        if (columns.empty()) {
            throw std::invalid_argument("CsvWriter: header needs at least one column");
        }
        header_ = std::move(columns);
        append_row_csv(buf_, header_);
    }

    void CsvWriter::add_row(const std::vector<std::string>& fields) {
        if (header_.empty()) {
            throw std::logic_error("CsvWriter: set_header must be called before add_row");
        }
        if (fields.size() != header_.size()) {
            throw std::invalid_argument("CsvWriter: field count does not match header");
        }
        append_row_csv(buf_, fields);
        ++rows_;
    }

    bool CsvWriter::save_to_file(const std::string& filepath) const {
        std::ofstream os(filepath, std::ios::binary | std::ios::trunc);
        if (!os) return false;
        os.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        return static_cast<bool>(os);
    }

    std::string join_decimal(std::span<const std::uint8_t> bytes, char sep) {
        std::string out;
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i) out.push_back(sep);
            out += std::to_string(bytes[i]);
        }
        return out;
    }

    std::string join_hex(std::span<const std::uint8_t> bytes, char sep) {
        static constexpr char k_digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(bytes.size() * 3);
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i) out.push_back(sep);
            out.push_back(k_digits[bytes[i] >> 4]);
            out.push_back(k_digits[bytes[i] & 0x0F]);
        }
        return out;
    }

} // namespace symecc::report
