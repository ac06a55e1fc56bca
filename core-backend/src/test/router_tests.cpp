#include "test_wager_core.hpp"
#include "../api/contract_router.hpp"

#include <boost/test/unit_test.hpp>

namespace http = boost::beast::http;

struct RouterTestingSetup : SettlementTestingSetup {
  Config config;
  api::ContractRouter router{db, events, balances, engine, orchestrator, config};

  RouterTestingSetup() {
    config.db_path = ":memory:";
    config.default_operation_ttl_seconds = 3600;
  }

  api::Response get(const std::string &target) {
    api::Request req{http::verb::get, target, 11};
    return router.handle(req);
  }

  api::Response post(const std::string &target, const json &body,
                     const std::string &identity = BACKEND) {
    api::Request req{http::verb::post, target, 11};
    req.set(api::IDENTITY_HEADER, identity);
    req.set(api::SIGNATURE_HEADER, "sig");
    req.set(http::field::content_type, "application/json");
    req.body() = body.dump();
    req.prepare_payload();
    return router.handle(req);
  }

  static json body_of(const api::Response &res) { return json::parse(res.body()); }
};

BOOST_FIXTURE_TEST_SUITE(router_tests, RouterTestingSetup)

BOOST_AUTO_TEST_CASE(health_and_unknown_route) {
  BOOST_CHECK(get("/api/health").result() == http::status::ok);
  BOOST_CHECK(get("/api/nope").result() == http::status::not_found);
}

BOOST_AUTO_TEST_CASE(tables_lists_schema) {
  auto res = get("/api/tables");
  BOOST_REQUIRE(res.result() == http::status::ok);
  bool found = false;
  for (const auto &t : body_of(res))
    found = found || t["name"] == "settlement_record";
  BOOST_CHECK(found);
}

BOOST_AUTO_TEST_CASE(ledger_round_trip_over_http) {
  auto res = post("/api/ledger/set", {{"user", "alice"}, {"withdrawable", "500"}, {"locked", "0"}});
  BOOST_REQUIRE(res.result() == http::status::ok);

  res = post("/api/ledger/lock", {{"user", "alice"}, {"amount", "200"}});
  BOOST_REQUIRE(res.result() == http::status::ok);
  BOOST_CHECK_EQUAL(body_of(res)["locked"].get<std::string>(), "200");

  res = get("/api/ledger/balance?user=alice");
  BOOST_REQUIRE(res.result() == http::status::ok);
  json balance_json = body_of(res);
  BOOST_CHECK_EQUAL(balance_json["withdrawable"].get<std::string>(), "300");
  BOOST_CHECK_EQUAL(balance_json["locked"].get<std::string>(), "200");

  res = get("/api/ledger/total?user=alice");
  BOOST_CHECK_EQUAL(body_of(res)["total"].get<std::string>(), "500");
}

BOOST_AUTO_TEST_CASE(domain_errors_map_to_status) {
  auto res = post("/api/ledger/lock", {{"user", "alice"}, {"amount", "1"}});
  BOOST_CHECK(res.result() == http::status::unprocessable_entity);
  json err = body_of(res);
  BOOST_CHECK_EQUAL(err["error"].get<std::string>(), "insufficient_withdrawable");
  BOOST_CHECK_EQUAL(err["code"].get<int>(), 5);

  res = post("/api/ledger/set", {{"user", "alice"}, {"withdrawable", "1"}, {"locked", "0"}},
             "mallory");
  BOOST_CHECK(res.result() == http::status::unauthorized);

  res = post("/api/ledger/init", {{"backend", "other"}});
  BOOST_CHECK(res.result() == http::status::conflict);
  BOOST_CHECK_EQUAL(body_of(res)["error"].get<std::string>(), "already_initialized");
}

BOOST_AUTO_TEST_CASE(malformed_requests_are_bad_request) {
  BOOST_CHECK(post("/api/ledger/set", {{"user", "alice"}, {"withdrawable", "1.5"}, {"locked", "0"}})
                  .result() == http::status::bad_request);
  BOOST_CHECK(post("/api/ledger/lock", {{"amount", "1"}}).result() == http::status::bad_request);
  BOOST_CHECK(get("/api/ledger/balance").result() == http::status::bad_request);
  BOOST_CHECK(get("/api/settlement/settled?wager_id=abc").result() == http::status::bad_request);
  BOOST_CHECK(get("/api/operations?scope=staking&hash=00").result() == http::status::bad_request);

  api::Request req{http::verb::post, "/api/ledger/set", 11};
  req.body() = "{not json";
  req.prepare_payload();
  BOOST_CHECK(router.handle(req).result() == http::status::bad_request);
}

BOOST_AUTO_TEST_CASE(settle_over_http_applies_default_ttl) {
  BOOST_REQUIRE(post("/api/ledger/set", {{"user", "alice"}, {"withdrawable", "0"}, {"locked", "100"}})
                    .result() == http::status::ok);

  std::string hash = core::Hash32::filled(0x21).hex();
  json settle = {{"operation_hash", "0x" + hash},
                 {"wager_id", "42"},
                 {"bettor", "alice"},
                 {"winner", "bob"},
                 {"staked_amount", "100"},
                 {"payout", "200"},
                 {"outcome", "WIN"}};
  auto res = post("/api/settlement/settle", settle);
  BOOST_REQUIRE(res.result() == http::status::ok);
  BOOST_CHECK_EQUAL(body_of(res)["payout"].get<std::string>(), "200");

  auto record = engine.get_record(idempotency::Scope::Settlement, core::Hash32::filled(0x21));
  BOOST_REQUIRE(record);
  BOOST_CHECK(record->ttl_seconds == std::optional<uint64_t>(3600));

  res = post("/api/settlement/settle", settle);
  BOOST_CHECK(res.result() == http::status::conflict);
  BOOST_CHECK_EQUAL(body_of(res)["error"].get<std::string>(), "duplicate_operation");

  res = get("/api/settlement/settled?wager_id=0x2a");
  BOOST_CHECK(body_of(res)["settled"].get<bool>());

  res = get("/api/settlement/record?wager_id=42");
  BOOST_REQUIRE(res.result() == http::status::ok);
  BOOST_CHECK_EQUAL(body_of(res)["winner"].get<std::string>(), "bob");

  res = get("/api/settlement/operation?hash=" + hash);
  BOOST_CHECK(body_of(res)["executed"].get<bool>());

  res = get("/api/operations?scope=settlement&hash=" + hash);
  BOOST_CHECK(body_of(res)["executed"].get<bool>());
  BOOST_CHECK_EQUAL(body_of(res)["ttl_seconds"].get<uint64_t>(), 3600u);

  res = post("/api/settlement/cleanup", {{"operation_hash", hash}});
  BOOST_CHECK(!body_of(res)["removed"].get<bool>());

  BOOST_CHECK(get("/api/settlement/record?wager_id=43").result() == http::status::not_found);
}

BOOST_AUTO_TEST_CASE(events_endpoint_returns_latest_first) {
  BOOST_REQUIRE(post("/api/ledger/set", {{"user", "alice"}, {"withdrawable", "1"}, {"locked", "0"}})
                    .result() == http::status::ok);
  BOOST_REQUIRE(post("/api/ledger/metrics", {{"user", "alice"}, {"staked", "1"}, {"won", "0"}, {"lost", "1"}})
                    .result() == http::status::ok);

  auto res = get("/api/events?limit=1");
  BOOST_REQUIRE(res.result() == http::status::ok);
  json list = body_of(res);
  BOOST_REQUIRE_EQUAL(list.size(), 1u);
  BOOST_CHECK_EQUAL(list[0]["topic"].get<std::string>(), topics::METRICS_UPDATED);
  BOOST_CHECK_EQUAL(list[0]["payload"]["after"]["total_lost"].get<std::string>(), "1");

  BOOST_CHECK(get("/api/events?limit=0").result() == http::status::bad_request);
}

BOOST_AUTO_TEST_CASE(settle_rejects_signed_or_fractional_ttl) {
  BOOST_REQUIRE(post("/api/ledger/set", {{"user", "alice"}, {"withdrawable", "0"}, {"locked", "100"}})
                    .result() == http::status::ok);

  json settle = {{"operation_hash", core::Hash32::filled(0x22).hex()},
                 {"wager_id", "77"},
                 {"bettor", "alice"},
                 {"staked_amount", "100"},
                 {"payout", "0"},
                 {"outcome", "LOSS"}};
  settle["ttl_seconds"] = -1;
  BOOST_CHECK(post("/api/settlement/settle", settle).result() == http::status::bad_request);
  settle["ttl_seconds"] = 1.5;
  BOOST_CHECK(post("/api/settlement/settle", settle).result() == http::status::bad_request);

  BOOST_CHECK(!engine.get_record(idempotency::Scope::Settlement, core::Hash32::filled(0x22)));
  BOOST_CHECK(!orchestrator.is_settled(core::WagerId::from_uint64(77)));
  BOOST_CHECK(balances.get_locked("alice") == 100);

  settle["ttl_seconds"] = 30;
  BOOST_REQUIRE(post("/api/settlement/settle", settle).result() == http::status::ok);
  auto record = engine.get_record(idempotency::Scope::Settlement, core::Hash32::filled(0x22));
  BOOST_REQUIRE(record);
  BOOST_CHECK(record->ttl_seconds == std::optional<uint64_t>(30));
}

BOOST_AUTO_TEST_SUITE_END()
