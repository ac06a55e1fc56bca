#pragma once

// ============================================================================
// Clock - 单调不减的逻辑时钟(秒)，TTL 过期判定的唯一时间来源
// ============================================================================

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>

class Clock {
public:
  virtual ~Clock() = default;
  virtual uint64_t now() = 0;
};

// 墙上时钟，回拨时保持上一次的值
class SystemClock : public Clock {
public:
  uint64_t now() override {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count();
    std::lock_guard<std::mutex> lock(mutex_);
    last_ = std::max(last_, static_cast<uint64_t>(secs < 0 ? 0 : secs));
    return last_;
  }

private:
  std::mutex mutex_;
  uint64_t last_ = 0;
};

// 测试用
class ManualClock : public Clock {
public:
  explicit ManualClock(uint64_t start = 0) : now_(start) {}

  uint64_t now() override { return now_; }

  void set(uint64_t ts) { now_ = std::max(now_, ts); }
  void advance(uint64_t secs) { now_ += secs; }

private:
  uint64_t now_;
};
