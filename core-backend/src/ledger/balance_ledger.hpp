#pragma once

// ============================================================================
// Balance Ledger - 每个用户的 (withdrawable, locked) 余额与累计指标
//
// 写入口都需要后端授权，流程一致：
//   授权 → 参数校验 → 读旧快照 → 计算新快照 → 校验不变量 → 事务落库 → 事件
// 读入口不需要授权，未知用户返回全 0
// ============================================================================

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../core/auth.hpp"
#include "../core/clock.hpp"
#include "../core/database.hpp"
#include "../core/errors.hpp"
#include "../core/event_log.hpp"
#include "../core/types.hpp"

namespace ledger {

using core::Amount;
using core::Identity;

struct UserBalance {
  Amount withdrawable = 0;
  Amount locked = 0;

  bool operator==(const UserBalance &) const = default;
};

struct UserMetrics {
  Amount total_staked = 0;
  Amount total_won = 0;
  Amount total_lost = 0;

  bool operator==(const UserMetrics &) const = default;
};

inline json balance_to_json(const UserBalance &b) {
  return {{"withdrawable", core::amount_to_string(b.withdrawable)},
          {"locked", core::amount_to_string(b.locked)}};
}

inline json metrics_to_json(const UserMetrics &m) {
  return {{"total_staked", core::amount_to_string(m.total_staked)},
          {"total_won", core::amount_to_string(m.total_won)},
          {"total_lost", core::amount_to_string(m.total_lost)}};
}

// 两个桶同时加 delta；任一溢出或变负都整体失败
inline Result<UserBalance> apply_balance_delta(const UserBalance &current,
                                               Amount withdrawable_delta,
                                               Amount locked_delta) {
  auto next_withdrawable = core::checked_add(current.withdrawable, withdrawable_delta);
  auto next_locked = core::checked_add(current.locked, locked_delta);
  if (!next_withdrawable || !next_locked)
    return make_error_code(Errc::overflow);

  if (*next_withdrawable < 0)
    return make_error_code(Errc::insufficient_withdrawable);
  if (*next_locked < 0)
    return make_error_code(Errc::insufficient_locked);

  return UserBalance{*next_withdrawable, *next_locked};
}

class BalanceLedger {
public:
  static constexpr const char *CONTRACT = "balance_ledger";

  BalanceLedger(Database &db, Clock &clock, EventLog &events,
                const ProofVerifier &verifier)
      : db_(db), clock_(clock), events_(events),
        auth_(db, clock, events, CONTRACT, verifier) {}

  Result<void> initialize(const Identity &backend) {
    return auth_.initialize(backend);
  }

  std::optional<Identity> backend() { return auth_.backend(); }

  // ==========================================================================
  // 写入口
  // ==========================================================================
  Result<UserBalance> set_balance(const AuthProof &proof, const Identity &user,
                                  Amount withdrawable, Amount locked) {
    auto lock = db_.serialize();
    if (auto r = auth_.require_auth(proof); !r)
      return r.error();
    if (withdrawable < 0 || locked < 0)
      return make_error_code(Errc::invalid_amount);

    return commit_balance(user, get_balance(user), UserBalance{withdrawable, locked});
  }

  Result<UserBalance> apply_delta(const AuthProof &proof, const Identity &user,
                                  Amount withdrawable_delta, Amount locked_delta) {
    auto lock = db_.serialize();
    if (auto r = auth_.require_auth(proof); !r)
      return r.error();

    UserBalance previous = get_balance(user);
    auto updated = apply_balance_delta(previous, withdrawable_delta, locked_delta);
    if (!updated)
      return updated.error();

    return commit_balance(user, previous, updated.value());
  }

  Result<UserBalance> lock_funds(const AuthProof &proof, const Identity &user,
                                 Amount amount) {
    auto lock = db_.serialize();
    if (auto r = auth_.require_auth(proof); !r)
      return r.error();
    if (amount <= 0)
      return make_error_code(Errc::invalid_amount);

    UserBalance previous = get_balance(user);
    if (previous.withdrawable < amount)
      return make_error_code(Errc::insufficient_withdrawable);

    // 等额反向的一次 delta，资金不会同时出现在两个桶或都不在
    auto updated = apply_balance_delta(previous, -amount, amount);
    if (!updated)
      return updated.error();
    return commit_balance(user, previous, updated.value());
  }

  Result<UserBalance> unlock_funds(const AuthProof &proof, const Identity &user,
                                   Amount amount) {
    auto lock = db_.serialize();
    if (auto r = auth_.require_auth(proof); !r)
      return r.error();
    if (amount <= 0)
      return make_error_code(Errc::invalid_amount);

    UserBalance previous = get_balance(user);
    if (previous.locked < amount)
      return make_error_code(Errc::insufficient_locked);

    auto updated = apply_balance_delta(previous, amount, -amount);
    if (!updated)
      return updated.error();
    return commit_balance(user, previous, updated.value());
  }

  Result<UserMetrics> record_metrics(const AuthProof &proof, const Identity &user,
                                     Amount staked_delta, Amount won_delta,
                                     Amount lost_delta) {
    auto lock = db_.serialize();
    if (auto r = auth_.require_auth(proof); !r)
      return r.error();
    if (staked_delta < 0 || won_delta < 0 || lost_delta < 0)
      return make_error_code(Errc::invalid_amount);

    UserMetrics previous = get_metrics(user);
    auto staked = core::checked_add(previous.total_staked, staked_delta);
    auto won = core::checked_add(previous.total_won, won_delta);
    auto lost = core::checked_add(previous.total_lost, lost_delta);
    if (!staked || !won || !lost)
      return make_error_code(Errc::overflow);

    UserMetrics updated{*staked, *won, *lost};
    uint64_t now = clock_.now();
    {
      Database::Transaction txn(db_);
      db_.execute("INSERT OR REPLACE INTO user_metrics "
                  "(user_id, total_staked, total_won, total_lost, updated_at) "
                  "VALUES (" +
                  Database::quote(user) + ", " + hugeint(updated.total_staked) +
                  ", " + hugeint(updated.total_won) + ", " +
                  hugeint(updated.total_lost) + ", " + std::to_string(now) + ")");
      txn.commit();
    }

    events_.publish(topics::METRICS_UPDATED, user,
                    {{"staked_delta", core::amount_to_string(staked_delta)},
                     {"won_delta", core::amount_to_string(won_delta)},
                     {"lost_delta", core::amount_to_string(lost_delta)},
                     {"before", metrics_to_json(previous)},
                     {"after", metrics_to_json(updated)}});
    return updated;
  }

  // ==========================================================================
  // 读入口
  // ==========================================================================
  UserBalance get_balance(const Identity &user) {
    auto rows = db_.query_json(
        "SELECT CAST(withdrawable AS VARCHAR) AS withdrawable, "
        "CAST(locked AS VARCHAR) AS locked FROM user_balance WHERE user_id = " +
        Database::quote(user));
    if (rows.empty())
      return {};
    return {read_amount(rows[0]["withdrawable"]), read_amount(rows[0]["locked"])};
  }

  Amount get_withdrawable(const Identity &user) { return get_balance(user).withdrawable; }

  Amount get_locked(const Identity &user) { return get_balance(user).locked; }

  Result<Amount> get_total(const Identity &user) {
    UserBalance b = get_balance(user);
    auto total = core::checked_add(b.withdrawable, b.locked);
    if (!total)
      return make_error_code(Errc::overflow);
    return *total;
  }

  UserMetrics get_metrics(const Identity &user) {
    auto rows = db_.query_json(
        "SELECT CAST(total_staked AS VARCHAR) AS total_staked, "
        "CAST(total_won AS VARCHAR) AS total_won, "
        "CAST(total_lost AS VARCHAR) AS total_lost "
        "FROM user_metrics WHERE user_id = " +
        Database::quote(user));
    if (rows.empty())
      return {};
    return {read_amount(rows[0]["total_staked"]), read_amount(rows[0]["total_won"]),
            read_amount(rows[0]["total_lost"])};
  }

private:
  Result<UserBalance> commit_balance(const Identity &user, const UserBalance &previous,
                                     const UserBalance &updated) {
    // 不变量：两个桶都非负
    if (updated.withdrawable < 0)
      return make_error_code(Errc::insufficient_withdrawable);
    if (updated.locked < 0)
      return make_error_code(Errc::insufficient_locked);

    uint64_t now = clock_.now();
    {
      Database::Transaction txn(db_);
      db_.execute("INSERT OR REPLACE INTO user_balance "
                  "(user_id, withdrawable, locked, updated_at) VALUES (" +
                  Database::quote(user) + ", " + hugeint(updated.withdrawable) +
                  ", " + hugeint(updated.locked) + ", " + std::to_string(now) +
                  ")");
      txn.commit();
    }

    events_.publish(topics::BALANCE_UPDATED, user,
                    {{"before", balance_to_json(previous)},
                     {"after", balance_to_json(updated)}});
    return updated;
  }

  static std::string hugeint(Amount v) {
    return "CAST('" + core::amount_to_string(v) + "' AS HUGEINT)";
  }

  static Amount read_amount(const json &v) {
    auto parsed = core::parse_amount(v.get<std::string>());
    if (!parsed)
      throw std::runtime_error("user_balance 中存在非法金额: " + v.dump());
    return *parsed;
  }

  Database &db_;
  Clock &clock_;
  EventLog &events_;
  BackendAuthority auth_;
};

} // namespace ledger
