#pragma once

// ============================================================================
// EventLog - 面向链下观察者的审计事件，内部不消费
// ============================================================================

#include <exception>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "clock.hpp"
#include "database.hpp"

using json = nlohmann::json;

namespace topics {
static constexpr const char *BALANCE_UPDATED = "balance_updated";
static constexpr const char *METRICS_UPDATED = "metrics_updated";
static constexpr const char *REPLAY_REJECTED = "replay_rejected";
static constexpr const char *SETTLEMENT_EXECUTED = "settlement_executed";
static constexpr const char *SETTLEMENT_COMPENSATED = "settlement_compensated";
static constexpr const char *SETTLEMENT_PARTIAL_FAILURE = "settlement_partial_failure";
static constexpr const char *CONTRACT_INITIALIZED = "contract_initialized";
} // namespace topics

class EventLog {
public:
  EventLog(Database &db, Clock &clock, bool echo = true)
      : db_(db), clock_(clock), echo_(echo) {}

  int64_t publish(const std::string &topic, const std::string &subject,
                  const json &payload) {
    std::string body = payload.dump();
    int64_t seq = -1;
    // 审计失败只记日志，不改变已提交调用的结果
    try {
      seq = db_.append_event(clock_.now(), topic, subject, body);
    } catch (const std::exception &e) {
      std::cerr << "[Event] 审计写入失败 " << topic << " " << subject << " "
                << body << ": " << e.what() << std::endl;
      return -1;
    }
    if (echo_) {
      std::cout << "[Event] #" << seq << " " << topic << " " << subject << " "
                << body << std::endl;
    }
    return seq;
  }

  json recent(int64_t limit) { return db_.recent_events(limit); }

  // 按 topic 统计，测试和 /api/events 使用
  int64_t count(const std::string &topic) {
    return db_.query_single_int("SELECT COUNT(*) FROM event_log WHERE topic = " +
                                Database::quote(topic));
  }

private:
  Database &db_;
  Clock &clock_;
  bool echo_;
};
