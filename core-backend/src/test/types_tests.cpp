#include "../core/clock.hpp"
#include "../core/types.hpp"

#include <boost/test/unit_test.hpp>

using namespace core;

BOOST_AUTO_TEST_SUITE(types_tests)

BOOST_AUTO_TEST_CASE(checked_add_refuses_to_wrap) {
  BOOST_CHECK(checked_add(1, 2) == std::optional<Amount>(3));
  BOOST_CHECK(!checked_add(AMOUNT_MAX, 1));
  BOOST_CHECK(!checked_add(AMOUNT_MIN, -1));
  BOOST_CHECK(checked_add(AMOUNT_MAX, -1) == std::optional<Amount>(AMOUNT_MAX - 1));
}

BOOST_AUTO_TEST_CASE(amount_decimal_text) {
  BOOST_CHECK_EQUAL(amount_to_string(0), "0");
  BOOST_CHECK_EQUAL(amount_to_string(-25), "-25");
  BOOST_CHECK_EQUAL(amount_to_string(AMOUNT_MAX),
                    "170141183460469231731687303715884105727");
  BOOST_CHECK_EQUAL(amount_to_string(AMOUNT_MIN),
                    "-170141183460469231731687303715884105728");

  BOOST_CHECK(parse_amount("170141183460469231731687303715884105727") ==
              std::optional<Amount>(AMOUNT_MAX));
  BOOST_CHECK(parse_amount("-170141183460469231731687303715884105728") ==
              std::optional<Amount>(AMOUNT_MIN));
  BOOST_CHECK(!parse_amount("170141183460469231731687303715884105728"));
  BOOST_CHECK(!parse_amount(""));
  BOOST_CHECK(!parse_amount("-"));
  BOOST_CHECK(!parse_amount("12a"));
  BOOST_CHECK(!parse_amount("1.5"));
  BOOST_CHECK(parse_amount("+7") == std::optional<Amount>(7));
}

BOOST_AUTO_TEST_CASE(hash_hex_parsing) {
  std::string hex(64, 'a');
  auto h = Hash32::from_hex(hex);
  BOOST_REQUIRE(h);
  BOOST_CHECK(*h == Hash32::filled(0xaa));
  BOOST_CHECK_EQUAL(h->hex(), hex);

  BOOST_CHECK(Hash32::from_hex("0x" + hex));
  BOOST_CHECK(!Hash32::from_hex(hex.substr(2)));
  BOOST_CHECK(!Hash32::from_hex(std::string(63, 'a') + "g"));
}

BOOST_AUTO_TEST_CASE(wager_id_decimal_and_hex_agree) {
  auto dec = WagerId::parse("42");
  auto hex = WagerId::parse("0x2a");
  BOOST_REQUIRE(dec && hex);
  BOOST_CHECK(*dec == *hex);
  BOOST_CHECK(*dec == WagerId::from_uint64(42));
  BOOST_CHECK_EQUAL(dec->hex(), std::string(62, '0') + "2a");

  BOOST_CHECK(WagerId::parse("18446744073709551616")); // 2^64 仍在 256 位内
  BOOST_CHECK(!WagerId::parse(""));
  BOOST_CHECK(!WagerId::parse("0x"));
  BOOST_CHECK(!WagerId::parse("-1"));
  BOOST_CHECK(!WagerId::parse("0x" + std::string(65, '1')));
}

BOOST_AUTO_TEST_CASE(manual_clock_never_goes_backwards) {
  ManualClock clock(100);
  clock.advance(5);
  BOOST_CHECK_EQUAL(clock.now(), 105u);
  clock.set(50);
  BOOST_CHECK_EQUAL(clock.now(), 105u);
  clock.set(200);
  BOOST_CHECK_EQUAL(clock.now(), 200u);
}

BOOST_AUTO_TEST_SUITE_END()
