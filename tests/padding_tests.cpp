#include <boost/test/unit_test.hpp>  // not the included runner
#include <symecc/rs/padding.h>
#include <cstdint>
#include <stdexcept>
#include <vector>

using namespace symecc::rs;

BOOST_AUTO_TEST_SUITE(padding_suite)

BOOST_AUTO_TEST_CASE(three_to_five) {
    const std::vector<std::uint8_t> d{ 142, 164, 186 };
    const auto out = pad(d, 5);
    const std::vector<std::uint8_t> want{ 142, 164, 186, 129, 115 };
    BOOST_TEST(out == want, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(first_pad_is_129_regardless_of_content) {
    const std::vector<std::uint8_t> a{ 1, 2, 3 };
    const std::vector<std::uint8_t> b{ 255, 0, 77 };
    const auto pa = pad(a, 5);
    const auto pb = pad(b, 5);
    BOOST_TEST(pa[3] == 129u);
    BOOST_TEST(pb[3] == 129u);
    // Later pad bytes depend on position only
    BOOST_TEST(pa[4] == pb[4]);
    BOOST_TEST(pa[4] == 115u);
}

BOOST_AUTO_TEST_CASE(pad_sequence_from_empty) {
    const std::vector<std::uint8_t> none;
    const auto out = pad(none, 8);
    const std::vector<std::uint8_t> want{ 129, 175, 70, 220, 115, 11, 161, 56 };
    BOOST_TEST(out == want, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(pad_sequence_matches_formula) {
    const std::vector<std::uint8_t> d{ 1, 2, 3, 4, 5 };
    const auto out = pad(d, 12);
    const std::vector<std::uint8_t> want{ 1, 2, 3, 4, 5, 129, 161, 56, 206, 101, 251, 147 };
    BOOST_TEST(out == want, boost::test_tools::per_element());

    for (std::size_t i = 6; i < 12; ++i) {
        const unsigned p = (((149 * (i + 1)) % 253) + 130) % 254;
        BOOST_TEST(out[i] == (p == 0 ? 254u : p));
    }
}

BOOST_AUTO_TEST_CASE(pad_byte_zero_maps_to_254) {
    // 149*(pos+1) mod 253 == 124 makes the sum 254 -> 0 -> 254.
    std::size_t hits = 0;
    for (std::size_t pos = 0; pos < 253; ++pos) {
        const auto b = pad_byte(pos, false);
        BOOST_TEST(b != 0u);
        if (((149 * (pos + 1)) % 253 + 130) % 254 == 0) {
            BOOST_TEST(b == 254u);
            ++hits;
        }
    }
    BOOST_TEST(hits == 1u);
    BOOST_TEST(pad_byte(7, true) == k_pad_first);
}

BOOST_AUTO_TEST_CASE(deterministic) {
    const std::vector<std::uint8_t> d{ 9, 8 };
    BOOST_TEST(pad(d, 30) == pad(d, 30), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(exact_length_is_unchanged) {
    const std::vector<std::uint8_t> d{ 10, 20, 30 };
    BOOST_TEST(pad(d, 3) == d, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(too_long_is_rejected) {
    const std::vector<std::uint8_t> d{ 10, 20, 30, 40 };
    BOOST_CHECK_THROW(pad(d, 3), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
