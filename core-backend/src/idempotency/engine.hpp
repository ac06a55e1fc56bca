#pragma once

// ============================================================================
// Idempotency Engine - (scope, operation_hash) 是否已执行且未过期
//
// guard()       - 首次执行写入记录；存活记录 → DuplicateOperation
// check()       - 只做拒绝判定，不写入
// is_executed() - 存活记录存在
// cleanup()     - 删除已过期记录
// ============================================================================

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "../core/clock.hpp"
#include "../core/database.hpp"
#include "../core/errors.hpp"
#include "../core/event_log.hpp"
#include "../core/types.hpp"

namespace idempotency {

enum class Scope : uint8_t {
  Settlement = 0,
  Mint = 1,
  Spin = 2,
};

inline const char *scope_name(Scope s) {
  switch (s) {
  case Scope::Settlement:
    return "settlement";
  case Scope::Mint:
    return "mint";
  case Scope::Spin:
    return "spin";
  }
  return "unknown";
}

inline std::optional<Scope> parse_scope(const std::string &s) {
  if (s == "settlement")
    return Scope::Settlement;
  if (s == "mint")
    return Scope::Mint;
  if (s == "spin")
    return Scope::Spin;
  return std::nullopt;
}

struct OperationRecord {
  uint64_t executed_at = 0;
  std::optional<uint64_t> ttl_seconds;

  // 无 TTL 永不过期；时钟未前进时饱和减法得 0
  bool is_expired(uint64_t now) const {
    if (!ttl_seconds)
      return false;
    uint64_t elapsed = now > executed_at ? now - executed_at : 0;
    return elapsed >= *ttl_seconds;
  }
};

class Engine {
public:
  Engine(Database &db, Clock &clock, EventLog &events)
      : db_(db), clock_(clock), events_(events) {}

  ledger::Result<void> guard(Scope scope, const core::Hash32 &hash,
                             std::optional<uint64_t> ttl_seconds) {
    Database::Transaction txn(db_);
    uint64_t now = clock_.now();

    auto existing = get_record(scope, hash);
    if (existing && !existing->is_expired(now)) {
      emit_replay_rejected(scope, hash, now);
      return ledger::make_error_code(ledger::Errc::duplicate_operation);
    }

    // 过期记录直接覆盖
    db_.execute("INSERT OR REPLACE INTO operation_record "
                "(scope, operation_hash, executed_at, ttl_seconds) VALUES (" +
                Database::quote(scope_name(scope)) + ", " +
                Database::quote(hash.hex()) + ", " + std::to_string(now) +
                ", " + ttl_sql(ttl_seconds) + ")");
    txn.commit();
    return outcome::success();
  }

  ledger::Result<void> check(Scope scope, const core::Hash32 &hash) {
    uint64_t now = clock_.now();
    auto existing = get_record(scope, hash);
    if (existing && !existing->is_expired(now)) {
      emit_replay_rejected(scope, hash, now);
      return ledger::make_error_code(ledger::Errc::duplicate_operation);
    }
    return outcome::success();
  }

  bool is_executed(Scope scope, const core::Hash32 &hash) {
    auto existing = get_record(scope, hash);
    return existing && !existing->is_expired(clock_.now());
  }

  bool cleanup(Scope scope, const core::Hash32 &hash) {
    Database::Transaction txn(db_);
    auto existing = get_record(scope, hash);
    if (!existing || !existing->is_expired(clock_.now()))
      return false;

    db_.execute("DELETE FROM operation_record WHERE " + key_sql(scope, hash));
    txn.commit();
    return true;
  }

  std::optional<OperationRecord> get_record(Scope scope, const core::Hash32 &hash) {
    auto rows = db_.query_json(
        "SELECT executed_at, ttl_seconds FROM operation_record WHERE " +
        key_sql(scope, hash));
    if (rows.empty())
      return std::nullopt;

    OperationRecord record;
    record.executed_at = static_cast<uint64_t>(rows[0]["executed_at"].get<int64_t>());
    if (!rows[0]["ttl_seconds"].is_null())
      record.ttl_seconds = static_cast<uint64_t>(rows[0]["ttl_seconds"].get<int64_t>());
    return record;
  }

private:
  static std::string key_sql(Scope scope, const core::Hash32 &hash) {
    return "scope = " + Database::quote(scope_name(scope)) +
           " AND operation_hash = " + Database::quote(hash.hex());
  }

  // BIGINT 存储，超过 int64 上限的 TTL 等同永不到期
  static std::string ttl_sql(std::optional<uint64_t> ttl) {
    if (!ttl)
      return "NULL";
    constexpr uint64_t cap = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    return std::to_string(*ttl > cap ? cap : *ttl);
  }

  void emit_replay_rejected(Scope scope, const core::Hash32 &hash, uint64_t now) {
    events_.publish(topics::REPLAY_REJECTED, hash.hex(),
                    {{"scope", scope_name(scope)},
                     {"operation_hash", hash.hex()},
                     {"timestamp", now}});
  }

  Database &db_;
  Clock &clock_;
  EventLog &events_;
};

} // namespace idempotency
