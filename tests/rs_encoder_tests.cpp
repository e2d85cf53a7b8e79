#include <boost/test/unit_test.hpp>  // not the included runner
#include <symecc/rs/rs_encoder.h>
#include <symecc/rs/factor_table.h>
#include <symecc/rs/padding.h>
#include <symecc/gf/gf256.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using namespace symecc::rs;

namespace {
    // ASCII codewords without digit-pair compaction.
    std::vector<std::uint8_t> plus_one(const std::string& s) {
        std::vector<std::uint8_t> v(s.size());
        for (size_t i = 0; i < s.size(); ++i) v[i] = static_cast<std::uint8_t>(static_cast<unsigned char>(s[i]) + 1);
        return v;
    }

    // Evaluates c(x) = Σ cw[k] x^(len-1-k) at x, highest degree first.
    std::uint8_t eval(const std::vector<std::uint8_t>& cw, std::uint8_t x) {
        std::uint8_t acc = 0;
        for (auto c : cw) acc = static_cast<std::uint8_t>(symecc::gf::multiply(acc, x) ^ c);
        return acc;
    }

    std::vector<std::uint8_t> encode_padded(const std::vector<std::uint8_t>& data, std::size_t data_size, std::size_t ecc_size) {
        return encode(pad(data, data_size), build_factor_table(ecc_size));
    }
} // namespace

BOOST_AUTO_TEST_SUITE(rs_encoder_suite)

BOOST_AUTO_TEST_CASE(symbol_10x10_worked_example) {
    const std::vector<std::uint8_t> data{ 142, 164, 186 };
    const auto ecc = encode(data, build_factor_table(5));
    const std::vector<std::uint8_t> want{ 114, 25, 5, 88, 102 };
    BOOST_TEST(ecc == want, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(symbol_10x10_single_letter) {
    // "A" -> 66, padded 66 129 70
    const auto ecc = encode_padded(plus_one("A"), 3, 5);
    const std::vector<std::uint8_t> want{ 138, 234, 82, 82, 95 };
    BOOST_TEST(ecc == want, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(symbol_12x12_worked_example) {
    const std::vector<std::uint8_t> data{ 147, 130, 141, 194 };
    const auto ecc = encode_padded(data, 5, 7);
    const std::vector<std::uint8_t> want{ 147, 186, 88, 236, 56, 227, 209 };
    BOOST_TEST(ecc == want, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(larger_symbols) {
    {
        const std::vector<std::uint8_t> data{ 230, 209, 42, 117, 151, 254, 84, 50 };
        const std::vector<std::uint8_t> want{ 190, 141, 4, 125, 151, 139, 66, 53, 80, 70 };
        BOOST_TEST(encode_padded(data, 8, 10) == want, boost::test_tools::per_element());
    }
    {
        const std::vector<std::uint8_t> want{ 104, 216, 88, 39, 233, 202, 71, 217, 26, 92, 25, 232 };
        BOOST_TEST(encode_padded(plus_one("Wikipedia"), 12, 12) == want, boost::test_tools::per_element());
    }
    {
        const std::vector<std::uint8_t> want{ 164, 206, 164, 35, 253, 4, 255, 108, 55, 191, 66, 252, 19, 49 };
        BOOST_TEST(encode_padded(plus_one("Hourez Jonathan"), 18, 14) == want, boost::test_tools::per_element());
    }
    {
        const std::vector<std::uint8_t> data{ 232, 131, 133, 175, 161, 150, 130, 130, 141, 147,
                                              139, 141, 155, 140, 66, 67, 68, 69, 142, 164 };
        const std::vector<std::uint8_t> want{ 112, 152, 81, 41, 248, 142, 14, 220, 196, 163,
                                              133, 17, 240, 14, 38, 15, 15, 160 };
        BOOST_TEST(encode_padded(data, 22, 18) == want, boost::test_tools::per_element());
    }
    {
        const std::vector<std::uint8_t> want{ 64, 198, 150, 168, 121, 187, 207, 220, 110, 53,
                                              82, 43, 31, 69, 26, 15, 7, 4, 101, 131 };
        BOOST_TEST(encode_padded(plus_one("http://www.idautomation.com"), 30, 20) == want,
            boost::test_tools::per_element());
    }
}

BOOST_AUTO_TEST_CASE(codeword_is_divisible_by_generator) {
    // data + ecc, read as a polynomial, vanishes at every generator root α^1..α^n.
    for (std::size_t n : { 5u, 7u, 11u, 18u, 28u }) {
        std::vector<std::uint8_t> data;
        for (std::size_t i = 0; i < 2 * n + 3; ++i) data.push_back(static_cast<std::uint8_t>(i * 37 + 11));
        const auto full = append_ecc(data, build_factor_table(n));
        BOOST_REQUIRE_EQUAL(full.size(), data.size() + n);
        for (unsigned i = 1; i <= n; ++i) {
            BOOST_TEST(eval(full, symecc::gf::power(2, i)) == 0u);
        }
    }
}

BOOST_AUTO_TEST_CASE(all_zero_codeword_gives_zero_ecc) {
    const std::vector<std::uint8_t> zeros(3, 0);
    const auto ecc = encode(zeros, build_factor_table(5));
    BOOST_TEST(ecc == std::vector<std::uint8_t>(5, 0), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(deterministic_and_append_consistent) {
    const std::vector<std::uint8_t> data{ 1, 2, 3, 4, 5, 6, 7 };
    const auto f = build_factor_table(10);
    const auto a = encode(data, f);
    const auto b = encode(data, f);
    BOOST_TEST(a == b, boost::test_tools::per_element());

    const auto full = append_ecc(data, f);
    BOOST_TEST(std::vector<std::uint8_t>(full.begin(), full.begin() + 7) == data, boost::test_tools::per_element());
    BOOST_TEST(std::vector<std::uint8_t>(full.begin() + 7, full.end()) == a, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(encode_into_writes_span) {
    const std::vector<std::uint8_t> data{ 142, 164, 186 };
    const auto f = build_factor_table(5);
    std::vector<std::uint8_t> out(5, 0xEE);
    encode_into(data, f, out);
    BOOST_TEST(out == encode(data, f), boost::test_tools::per_element());

    std::vector<std::uint8_t> wrong(4);
    BOOST_CHECK_THROW(encode_into(data, f, wrong), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(invalid_arguments) {
    const std::vector<std::uint8_t> none;
    const std::vector<std::uint8_t> data{ 1, 2 };
    const auto f = build_factor_table(5);
    BOOST_CHECK_THROW(encode(none, f), std::invalid_argument);
    BOOST_CHECK_THROW(encode(data, none), std::invalid_argument);
    BOOST_CHECK_THROW(append_ecc(none, f), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
