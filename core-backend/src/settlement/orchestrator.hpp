#pragma once

// ============================================================================
// Settlement Orchestrator - 注单结算 Unsettled → Settled(终态)
//
// 两道独立的防重：
//   1. operation_hash：TTL 限时，防后端重试重复提交
//   2. wager_id：永久，记录过期清理后也不能二次结算
//
// 资金移动通过 BalanceLedger 的 apply_delta 完成，每次调用各自提交；
// WIN 的两次调用之间没有共享事务，第二次失败时走补偿(见 settle_win)
// ============================================================================

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../core/auth.hpp"
#include "../core/clock.hpp"
#include "../core/database.hpp"
#include "../core/errors.hpp"
#include "../core/event_log.hpp"
#include "../core/types.hpp"
#include "../idempotency/engine.hpp"
#include "../ledger/balance_ledger.hpp"

namespace settlement {

using core::Amount;
using core::Identity;
using ledger::Errc;
using ledger::Result;

enum class Outcome : uint8_t {
  Win = 0,
  Loss = 1,
  Draw = 2,
};

inline const char *outcome_name(Outcome o) {
  switch (o) {
  case Outcome::Win:
    return "WIN";
  case Outcome::Loss:
    return "LOSS";
  case Outcome::Draw:
    return "DRAW";
  }
  return "UNKNOWN";
}

inline std::optional<Outcome> parse_outcome(const std::string &tag) {
  if (tag == "WIN")
    return Outcome::Win;
  if (tag == "LOSS")
    return Outcome::Loss;
  if (tag == "DRAW")
    return Outcome::Draw;
  return std::nullopt;
}

struct SettleRequest {
  core::Hash32 operation_hash;
  core::WagerId wager_id;
  Identity bettor;
  std::optional<Identity> winner;
  Amount staked_amount = 0;
  Amount payout = 0;
  std::string outcome; // 原始标签，未知值 → InvalidStatus
  std::optional<uint64_t> ttl_seconds;
};

struct SettlementRecord {
  core::WagerId wager_id;
  Outcome outcome = Outcome::Loss;
  Identity bettor;
  std::optional<Identity> winner;
  Amount staked_amount = 0;
  Amount payout = 0;
  core::Hash32 operation_hash;
  uint64_t timestamp = 0;
};

inline json record_to_json(const SettlementRecord &r) {
  return {{"wager_id", r.wager_id.hex()},
          {"outcome", outcome_name(r.outcome)},
          {"bettor", r.bettor},
          {"winner", r.winner ? json(*r.winner) : json(nullptr)},
          {"staked_amount", core::amount_to_string(r.staked_amount)},
          {"payout", core::amount_to_string(r.payout)},
          {"operation_hash", r.operation_hash.hex()},
          {"timestamp", r.timestamp}};
}

class Orchestrator {
public:
  static constexpr const char *CONTRACT = "settlement";
  static constexpr idempotency::Scope SCOPE = idempotency::Scope::Settlement;

  Orchestrator(Database &db, Clock &clock, EventLog &events,
               const ProofVerifier &verifier, ledger::BalanceLedger &ledger,
               idempotency::Engine &idempotency, bool compensate_partial = true)
      : db_(db), clock_(clock), events_(events),
        auth_(db, clock, events, CONTRACT, verifier), ledger_(ledger),
        idempotency_(idempotency), compensate_partial_(compensate_partial) {}

  Result<void> initialize(const Identity &backend) {
    return auth_.initialize(backend);
  }

  std::optional<Identity> backend() { return auth_.backend(); }

  Result<SettlementRecord> settle(const AuthProof &proof, const SettleRequest &req) {
    auto lock = db_.serialize();

    if (auto r = auth_.require_auth(proof); !r)
      return r.error();
    if (auto r = idempotency_.check(SCOPE, req.operation_hash); !r)
      return r.error();
    if (is_settled(req.wager_id))
      return make_error_code(Errc::bet_already_settled);

    auto parsed = parse_outcome(req.outcome);
    if (!parsed)
      return make_error_code(Errc::invalid_status);
    if (*parsed == Outcome::Win && !req.winner)
      return make_error_code(Errc::invalid_bet);
    if (req.staked_amount < 0 || req.payout < 0)
      return make_error_code(Errc::invalid_amount);

    ledger::UserBalance bettor_before = ledger_.get_balance(req.bettor);
    std::optional<ledger::UserBalance> winner_before;
    if (*parsed == Outcome::Win)
      winner_before = ledger_.get_balance(*req.winner);

    Result<void> moved = outcome::success();
    switch (*parsed) {
    case Outcome::Win:
      moved = settle_win(proof, req);
      break;
    case Outcome::Loss:
      // 托管释放不退回，平台留存
      moved = as_void(ledger_.apply_delta(proof, req.bettor, 0, -req.staked_amount));
      break;
    case Outcome::Draw:
      // 原额退回可用余额
      moved = as_void(ledger_.apply_delta(proof, req.bettor, req.staked_amount,
                                          -req.staked_amount));
      break;
    }
    if (!moved)
      return moved.error();

    SettlementRecord record{req.wager_id, *parsed, req.bettor,
                            *parsed == Outcome::Win ? req.winner : std::nullopt,
                            req.staked_amount, req.payout, req.operation_hash,
                            clock_.now()};

    // 资金移动都成功后才消耗 operation_hash 并标记已结算
    {
      Database::Transaction txn(db_);
      if (auto r = idempotency_.guard(SCOPE, req.operation_hash, req.ttl_seconds); !r)
        return r.error();
      db_.execute(
          "INSERT INTO settlement_record (wager_id, outcome, bettor, winner, "
          "staked_amount, payout, operation_hash, settled_at) VALUES (" +
          Database::quote(record.wager_id.hex()) + ", " +
          Database::quote(outcome_name(record.outcome)) + ", " +
          Database::quote(record.bettor) + ", " +
          (record.winner ? Database::quote(*record.winner) : std::string("NULL")) +
          ", " + hugeint(record.staked_amount) + ", " + hugeint(record.payout) +
          ", " + Database::quote(record.operation_hash.hex()) + ", " +
          std::to_string(record.timestamp) + ")");
      txn.commit();
    }

    json payload = record_to_json(record);
    payload["bettor_before"] = ledger::balance_to_json(bettor_before);
    payload["bettor_after"] = ledger::balance_to_json(ledger_.get_balance(req.bettor));
    if (winner_before) {
      payload["winner_before"] = ledger::balance_to_json(*winner_before);
      payload["winner_after"] = ledger::balance_to_json(ledger_.get_balance(*req.winner));
    }
    events_.publish(topics::SETTLEMENT_EXECUTED, record.wager_id.hex(), payload);
    return record;
  }

  bool is_settled(const core::WagerId &wager_id) {
    return db_.query_single_int(
               "SELECT COUNT(*) FROM settlement_record WHERE wager_id = " +
               Database::quote(wager_id.hex())) > 0;
  }

  std::optional<SettlementRecord> get_settlement(const core::WagerId &wager_id) {
    auto rows = db_.query_json(
        "SELECT outcome, bettor, winner, CAST(staked_amount AS VARCHAR) AS staked_amount, "
        "CAST(payout AS VARCHAR) AS payout, operation_hash, settled_at "
        "FROM settlement_record WHERE wager_id = " +
        Database::quote(wager_id.hex()));
    if (rows.empty())
      return std::nullopt;

    const auto &row = rows[0];
    auto parsed = parse_outcome(row["outcome"].get<std::string>());
    auto staked = core::parse_amount(row["staked_amount"].get<std::string>());
    auto payout = core::parse_amount(row["payout"].get<std::string>());
    auto op_hash = core::Hash32::from_hex(row["operation_hash"].get<std::string>());
    if (!parsed || !staked || !payout || !op_hash)
      throw std::runtime_error("settlement_record 损坏: " + wager_id.hex());

    SettlementRecord record;
    record.wager_id = wager_id;
    record.outcome = *parsed;
    record.bettor = row["bettor"].get<std::string>();
    if (!row["winner"].is_null())
      record.winner = row["winner"].get<std::string>();
    record.staked_amount = *staked;
    record.payout = *payout;
    record.operation_hash = *op_hash;
    record.timestamp = static_cast<uint64_t>(row["settled_at"].get<int64_t>());
    return record;
  }

  bool is_operation_executed(const core::Hash32 &operation_hash) {
    return idempotency_.is_executed(SCOPE, operation_hash);
  }

  bool cleanup_operation(const core::Hash32 &operation_hash) {
    return idempotency_.cleanup(SCOPE, operation_hash);
  }

private:
  // 先释放败方托管，再给赢家入账。第二步失败时第一步已提交：
  // 开启补偿则把托管加回去，否则保留部分失败状态并记录
  Result<void> settle_win(const AuthProof &proof, const SettleRequest &req) {
    auto released = ledger_.apply_delta(proof, req.bettor, 0, -req.staked_amount);
    if (!released)
      return released.error();

    auto credited = ledger_.apply_delta(proof, *req.winner, req.payout, 0);
    if (credited)
      return outcome::success();

    json detail = {{"wager_id", req.wager_id.hex()},
                   {"operation_hash", req.operation_hash.hex()},
                   {"bettor", req.bettor},
                   {"winner", *req.winner},
                   {"staked_amount", core::amount_to_string(req.staked_amount)},
                   {"payout", core::amount_to_string(req.payout)},
                   {"error", credited.error().message()}};

    if (compensate_partial_) {
      auto restored = ledger_.apply_delta(proof, req.bettor, 0, req.staked_amount);
      if (restored) {
        events_.publish(topics::SETTLEMENT_COMPENSATED, req.wager_id.hex(), detail);
        return credited.error();
      }
      detail["compensation_error"] = restored.error().message();
    }

    std::cerr << "[Settlement] wager " << req.wager_id.hex()
              << " 部分失败: 托管已释放但赢家未入账 (" << credited.error().message()
              << ")" << std::endl;
    events_.publish(topics::SETTLEMENT_PARTIAL_FAILURE, req.wager_id.hex(), detail);
    return credited.error();
  }

  template <class T> static Result<void> as_void(const Result<T> &r) {
    if (!r)
      return r.error();
    return outcome::success();
  }

  static std::string hugeint(Amount v) {
    return "CAST('" + core::amount_to_string(v) + "' AS HUGEINT)";
  }

  Database &db_;
  Clock &clock_;
  EventLog &events_;
  BackendAuthority auth_;
  ledger::BalanceLedger &ledger_;
  idempotency::Engine &idempotency_;
  bool compensate_partial_;
};

} // namespace settlement
