#pragma once

// ============================================================================
// ContractRouter - HTTP 请求 → 合约入口，不依赖 socket
//
// 金额一律十进制字符串；授权证明放在请求头：
//   X-Backend-Identity / X-Backend-Signature
// 领域错误 → {"error": name, "code": n}，状态码见 status_for()
// ============================================================================

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "../core/auth.hpp"
#include "../core/config.hpp"
#include "../core/database.hpp"
#include "../core/errors.hpp"
#include "../core/event_log.hpp"
#include "../core/types.hpp"
#include "../idempotency/engine.hpp"
#include "../ledger/balance_ledger.hpp"
#include "../settlement/orchestrator.hpp"

namespace api {

namespace http = boost::beast::http;
using json = nlohmann::json;
using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

static constexpr const char *IDENTITY_HEADER = "X-Backend-Identity";
static constexpr const char *SIGNATURE_HEADER = "X-Backend-Signature";

// 请求参数不合法 → 400
class BadRequest : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

inline http::status status_for(ledger::Errc e) {
  switch (e) {
  case ledger::Errc::unauthorized:
    return http::status::unauthorized;
  case ledger::Errc::already_initialized:
  case ledger::Errc::bet_already_settled:
  case ledger::Errc::duplicate_operation:
    return http::status::conflict;
  case ledger::Errc::not_initialized:
    return http::status::service_unavailable;
  default:
    return http::status::unprocessable_entity;
  }
}

class ContractRouter {
public:
  ContractRouter(Database &db, EventLog &events, ledger::BalanceLedger &ledger,
                 idempotency::Engine &idempotency,
                 settlement::Orchestrator &settlement, const Config &config)
      : db_(db), events_(events), ledger_(ledger), idempotency_(idempotency),
        settlement_(settlement), config_(config) {}

  Response handle(const Request &req) {
    Response res;
    res.version(req.version());
    res.keep_alive(req.keep_alive());
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers,
            "Content-Type, X-Backend-Identity, X-Backend-Signature");

    if (req.method() == http::verb::options) {
      res.result(http::status::ok);
      res.prepare_payload();
      return res;
    }

    std::string target(req.target());
    std::string path = target.substr(0, target.find('?'));
    bool post = req.method() == http::verb::post;

    try {
      if (path == "/api/health") {
        reply(res, http::status::ok, {{"status", "ok"}});
      } else if (path == "/api/tables") {
        handle_tables(res);
      } else if (path == "/api/events") {
        handle_events(req, res);
      } else if (path == "/api/operations") {
        handle_operations(req, res);
      } else if (path.starts_with("/api/ledger/")) {
        if (post)
          handle_ledger_write(path, req, res);
        else
          handle_ledger_read(path, req, res);
      } else if (path.starts_with("/api/settlement/")) {
        if (post)
          handle_settlement_write(path, req, res);
        else
          handle_settlement_read(path, req, res);
      } else {
        reply(res, http::status::not_found, {{"error", "Not found"}});
      }
    } catch (const BadRequest &e) {
      reply(res, http::status::bad_request, {{"error", e.what()}});
    } catch (const json::exception &e) {
      reply(res, http::status::bad_request, {{"error", e.what()}});
    } catch (const std::exception &e) {
      std::cerr << "[HTTP] " << path << " 失败: " << e.what() << std::endl;
      reply(res, http::status::internal_server_error, {{"error", e.what()}});
    }

    res.prepare_payload();
    return res;
  }

private:
  // ==========================================================================
  // 通用
  // ==========================================================================
  void handle_tables(Response &res) {
    json tables_info = json::array();
    for (const auto &t : db_.get_tables()) {
      std::string name = t["table_name"].get<std::string>();
      tables_info.push_back({{"name", name}, {"count", db_.get_table_count(name)}});
    }
    reply(res, http::status::ok, tables_info);
  }

  void handle_events(const Request &req, Response &res) {
    std::string limit_str = get_param(req, "limit");
    int64_t limit = limit_str.empty() ? 100 : parse_int(limit_str, "limit");
    if (limit <= 0)
      throw BadRequest("limit must be positive");

    json result = json::array();
    for (const auto &row : events_.recent(limit)) {
      result.push_back({{"seq", row["seq"]},
                        {"ts", row["ts"]},
                        {"topic", row["topic"]},
                        {"subject", row["subject"]},
                        {"payload", json::parse(row["payload"].get<std::string>())}});
    }
    reply(res, http::status::ok, result);
  }

  void handle_operations(const Request &req, Response &res) {
    auto scope = idempotency::parse_scope(require_param(req, "scope"));
    if (!scope)
      throw BadRequest("unknown scope");
    auto hash = parse_hash(require_param(req, "hash"));

    json result = {{"scope", idempotency::scope_name(*scope)},
                   {"operation_hash", hash.hex()},
                   {"executed", idempotency_.is_executed(*scope, hash)}};
    if (auto record = idempotency_.get_record(*scope, hash)) {
      result["executed_at"] = record->executed_at;
      result["ttl_seconds"] = record->ttl_seconds ? json(*record->ttl_seconds) : json(nullptr);
    }
    reply(res, http::status::ok, result);
  }

  // ==========================================================================
  // Balance Ledger
  // ==========================================================================
  void handle_ledger_write(const std::string &path, const Request &req, Response &res) {
    json body = parse_body(req);

    if (path == "/api/ledger/init") {
      auto r = ledger_.initialize(require_string(body, "backend"));
      if (!r)
        return reply_error(res, r.error());
      return reply(res, http::status::ok, {{"backend", body["backend"]}});
    }

    AuthProof proof = proof_from(req);
    std::string user = require_string(body, "user");

    if (path == "/api/ledger/set") {
      return reply_balance(res, user,
                           ledger_.set_balance(proof, user, amount_field(body, "withdrawable"),
                                               amount_field(body, "locked")));
    }
    if (path == "/api/ledger/delta") {
      return reply_balance(res, user,
                           ledger_.apply_delta(proof, user,
                                               amount_field(body, "withdrawable_delta"),
                                               amount_field(body, "locked_delta")));
    }
    if (path == "/api/ledger/lock") {
      return reply_balance(res, user,
                           ledger_.lock_funds(proof, user, amount_field(body, "amount")));
    }
    if (path == "/api/ledger/unlock") {
      return reply_balance(res, user,
                           ledger_.unlock_funds(proof, user, amount_field(body, "amount")));
    }
    if (path == "/api/ledger/metrics") {
      auto r = ledger_.record_metrics(proof, user, amount_field(body, "staked"),
                                      amount_field(body, "won"), amount_field(body, "lost"));
      if (!r)
        return reply_error(res, r.error());
      json result = ledger::metrics_to_json(r.value());
      result["user"] = user;
      return reply(res, http::status::ok, result);
    }
    reply(res, http::status::not_found, {{"error", "Not found"}});
  }

  void handle_ledger_read(const std::string &path, const Request &req, Response &res) {
    std::string user = require_param(req, "user");

    if (path == "/api/ledger/balance") {
      json result = ledger::balance_to_json(ledger_.get_balance(user));
      result["user"] = user;
      return reply(res, http::status::ok, result);
    }
    if (path == "/api/ledger/total") {
      auto r = ledger_.get_total(user);
      if (!r)
        return reply_error(res, r.error());
      return reply(res, http::status::ok,
                   {{"user", user}, {"total", core::amount_to_string(r.value())}});
    }
    if (path == "/api/ledger/metrics") {
      json result = ledger::metrics_to_json(ledger_.get_metrics(user));
      result["user"] = user;
      return reply(res, http::status::ok, result);
    }
    reply(res, http::status::not_found, {{"error", "Not found"}});
  }

  // ==========================================================================
  // Settlement
  // ==========================================================================
  void handle_settlement_write(const std::string &path, const Request &req,
                               Response &res) {
    json body = parse_body(req);

    if (path == "/api/settlement/init") {
      auto r = settlement_.initialize(require_string(body, "backend"));
      if (!r)
        return reply_error(res, r.error());
      return reply(res, http::status::ok, {{"backend", body["backend"]}});
    }
    if (path == "/api/settlement/settle") {
      auto r = settlement_.settle(proof_from(req), settle_request_from(body));
      if (!r)
        return reply_error(res, r.error());
      return reply(res, http::status::ok, settlement::record_to_json(r.value()));
    }
    if (path == "/api/settlement/cleanup") {
      auto hash = parse_hash(require_string(body, "operation_hash"));
      return reply(res, http::status::ok,
                   {{"operation_hash", hash.hex()},
                    {"removed", settlement_.cleanup_operation(hash)}});
    }
    reply(res, http::status::not_found, {{"error", "Not found"}});
  }

  void handle_settlement_read(const std::string &path, const Request &req,
                              Response &res) {
    if (path == "/api/settlement/operation") {
      auto hash = parse_hash(require_param(req, "hash"));
      return reply(res, http::status::ok,
                   {{"operation_hash", hash.hex()},
                    {"executed", settlement_.is_operation_executed(hash)}});
    }

    auto wager_id = parse_wager_id(require_param(req, "wager_id"));
    if (path == "/api/settlement/settled") {
      return reply(res, http::status::ok,
                   {{"wager_id", wager_id.hex()},
                    {"settled", settlement_.is_settled(wager_id)}});
    }
    if (path == "/api/settlement/record") {
      auto record = settlement_.get_settlement(wager_id);
      if (!record)
        return reply(res, http::status::not_found, {{"error", "Settlement not found"}});
      return reply(res, http::status::ok, settlement::record_to_json(*record));
    }
    reply(res, http::status::not_found, {{"error", "Not found"}});
  }

  settlement::SettleRequest settle_request_from(const json &body) {
    settlement::SettleRequest req;
    req.operation_hash = parse_hash(require_string(body, "operation_hash"));
    req.wager_id = parse_wager_id(require_string(body, "wager_id"));
    req.bettor = require_string(body, "bettor");
    if (body.contains("winner") && !body["winner"].is_null())
      req.winner = body["winner"].get<std::string>();
    req.staked_amount = amount_field(body, "staked_amount");
    req.payout = amount_field(body, "payout");
    req.outcome = require_string(body, "outcome");

    if (body.contains("ttl_seconds") && !body["ttl_seconds"].is_null()) {
      // 只接受非负整数
      if (!body["ttl_seconds"].is_number_unsigned())
        throw BadRequest("ttl_seconds must be a non-negative integer");
      req.ttl_seconds = body["ttl_seconds"].get<uint64_t>();
    } else
      req.ttl_seconds = config_.default_operation_ttl_seconds;
    return req;
  }

  // ==========================================================================
  // 辅助
  // ==========================================================================
  static AuthProof proof_from(const Request &req) {
    AuthProof proof;
    auto identity = req.find(IDENTITY_HEADER);
    if (identity != req.end())
      proof.identity = std::string(identity->value());
    auto signature = req.find(SIGNATURE_HEADER);
    if (signature != req.end())
      proof.signature = std::string(signature->value());
    return proof;
  }

  static json parse_body(const Request &req) {
    if (req.body().empty())
      throw BadRequest("Missing request body");
    json body = json::parse(req.body());
    if (!body.is_object())
      throw BadRequest("Request body must be a JSON object");
    return body;
  }

  static std::string require_string(const json &body, const char *key) {
    if (!body.contains(key) || !body[key].is_string())
      throw BadRequest(std::string("Missing string field '") + key + "'");
    return body[key].get<std::string>();
  }

  // 十进制字符串，也接受 JSON 整数
  static core::Amount amount_field(const json &body, const char *key) {
    if (!body.contains(key))
      throw BadRequest(std::string("Missing amount field '") + key + "'");
    const json &v = body[key];
    std::optional<core::Amount> parsed;
    if (v.is_string())
      parsed = core::parse_amount(v.get<std::string>());
    else if (v.is_number_unsigned())
      parsed = static_cast<core::Amount>(v.get<uint64_t>());
    else if (v.is_number_integer())
      parsed = static_cast<core::Amount>(v.get<int64_t>());
    if (!parsed)
      throw BadRequest(std::string("Invalid amount for '") + key + "'");
    return *parsed;
  }

  static core::Hash32 parse_hash(const std::string &s) {
    auto hash = core::Hash32::from_hex(s);
    if (!hash)
      throw BadRequest("operation hash must be 32 bytes of hex");
    return *hash;
  }

  static core::WagerId parse_wager_id(const std::string &s) {
    auto id = core::WagerId::parse(s);
    if (!id)
      throw BadRequest("Invalid wager_id");
    return *id;
  }

  static int64_t parse_int(const std::string &s, const char *name) {
    auto v = core::parse_amount(s);
    if (!v || *v > INT64_MAX || *v < INT64_MIN)
      throw BadRequest(std::string("Invalid integer parameter '") + name + "'");
    return static_cast<int64_t>(*v);
  }

  static std::string require_param(const Request &req, const char *name) {
    std::string value = get_param(req, name);
    if (value.empty())
      throw BadRequest(std::string("Missing ") + name + " parameter");
    return value;
  }

  // 按 & 切分查询串，精确匹配键名
  static std::string get_param(const Request &req, const char *name) {
    std::string target(req.target());
    auto q = target.find('?');
    if (q == std::string::npos)
      return "";

    std::string query = target.substr(q + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
      size_t amp = query.find('&', pos);
      if (amp == std::string::npos)
        amp = query.size();
      std::string pair = query.substr(pos, amp - pos);
      auto eq = pair.find('=');
      if (eq != std::string::npos && pair.compare(0, eq, name) == 0 &&
          eq == std::char_traits<char>::length(name))
        return url_decode(pair.substr(eq + 1));
      pos = amp + 1;
    }
    return "";
  }

  static std::string url_decode(const std::string &str) {
    std::string result;
    for (size_t i = 0; i < str.size(); ++i) {
      if (str[i] == '%' && i + 2 < str.size() && core::hex_value(str[i + 1]) >= 0 &&
          core::hex_value(str[i + 2]) >= 0) {
        result += static_cast<char>((core::hex_value(str[i + 1]) << 4) |
                                    core::hex_value(str[i + 2]));
        i += 2;
      } else if (str[i] == '+') {
        result += ' ';
      } else {
        result += str[i];
      }
    }
    return result;
  }

  static void reply(Response &res, http::status status, const json &body) {
    res.result(status);
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
  }

  static void reply_error(Response &res, const boost::system::error_code &ec) {
    if (ec.category() != ledger::errc_category()) {
      reply(res, http::status::internal_server_error, {{"error", ec.message()}});
      return;
    }
    auto e = static_cast<ledger::Errc>(ec.value());
    reply(res, status_for(e), {{"error", ledger::errc_name(e)}, {"code", ec.value()}});
  }

  static void reply_balance(Response &res, const std::string &user,
                            const ledger::Result<ledger::UserBalance> &r) {
    if (!r)
      return reply_error(res, r.error());
    json result = ledger::balance_to_json(r.value());
    result["user"] = user;
    reply(res, http::status::ok, result);
  }

  Database &db_;
  EventLog &events_;
  ledger::BalanceLedger &ledger_;
  idempotency::Engine &idempotency_;
  settlement::Orchestrator &settlement_;
  const Config &config_;
};

} // namespace api
