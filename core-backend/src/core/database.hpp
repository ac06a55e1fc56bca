#pragma once

#include <duckdb.hpp>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <sys/file.h>
#include <unistd.h>

using json = nlohmann::json;

class Database {
public:
  explicit Database(const std::string &path) : db_path_(path) {
    db_ = std::make_unique<duckdb::DuckDB>(is_memory() ? std::string() : path);
    conn_ = std::make_unique<duckdb::Connection>(*db_);
    audit_conn_ = std::make_unique<duckdb::Connection>(*db_);

    if (!is_memory()) {
      lock_path_ = path + ".lock";
      lock_fd_ = open(lock_path_.c_str(), O_CREAT | O_RDWR, 0666);
      if (lock_fd_ < 0)
        throw std::runtime_error("无法创建锁文件: " + lock_path_);
    }
  }

  ~Database() {
    if (has_write_lock_) {
      release_write_lock();
    }
    if (lock_fd_ >= 0) {
      close(lock_fd_);
    }
  }

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  bool is_memory() const { return db_path_.empty() || db_path_ == ":memory:"; }

  // ==========================================================================
  // 跨进程单写者锁(内存库无需)
  // ==========================================================================
  void acquire_write_lock() {
    if (lock_fd_ < 0 || has_write_lock_)
      return;
    if (flock(lock_fd_, LOCK_EX) != 0)
      throw std::runtime_error("获取写锁失败: " + lock_path_);
    has_write_lock_ = true;
  }

  void release_write_lock() {
    if (!has_write_lock_)
      return;
    flock(lock_fd_, LOCK_UN);
    has_write_lock_ = false;
  }

  class WriteLock {
  public:
    explicit WriteLock(Database &db) : db_(db) { db_.acquire_write_lock(); }
    ~WriteLock() { db_.release_write_lock(); }
    WriteLock(const WriteLock &) = delete;
    WriteLock &operator=(const WriteLock &) = delete;

  private:
    Database &db_;
  };

  // ==========================================================================
  // 入口串行化 + 事务
  // ==========================================================================

  // 每个合约入口持有，保证调用之间严格串行
  std::unique_lock<std::recursive_mutex> serialize() {
    return std::unique_lock<std::recursive_mutex>(mutex_);
  }

  // 嵌套事务并入最外层：只有最外层发出 BEGIN/COMMIT/ROLLBACK
  class Transaction {
  public:
    explicit Transaction(Database &db) : db_(db), lock_(db.mutex_) {
      outermost_ = db_.tx_depth_ == 0;
      // BEGIN 抛异常时析构不会执行，深度只在成功后计入
      if (outermost_)
        db_.execute("BEGIN TRANSACTION");
      ++db_.tx_depth_;
    }

    ~Transaction() {
      if (outermost_ && !committed_) {
        auto r = db_.conn_->Query("ROLLBACK");
        if (r->HasError())
          std::cerr << "[DB] ROLLBACK 失败: " << r->GetError() << std::endl;
      }
      --db_.tx_depth_;
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit() {
      if (committed_)
        return;
      if (outermost_)
        db_.execute("COMMIT");
      committed_ = true;
    }

  private:
    Database &db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool outermost_ = false;
    bool committed_ = false;
  };

  // ==========================================================================
  // SQL
  // ==========================================================================
  void execute(const std::string &sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto result = conn_->Query(sql);
    if (result->HasError())
      throw std::runtime_error("execute failed: " + result->GetError());
  }

  json query_json(const std::string &sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return to_json(conn_->Query(sql));
  }

  int64_t query_single_int(const std::string &sql) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto result = conn_->Query(sql);
    if (result->HasError())
      throw std::runtime_error("query failed: " + result->GetError());
    if (result->RowCount() == 0)
      return 0;
    auto val = result->GetValue(0, 0);
    return val.IsNull() ? 0 : val.GetValue<int64_t>();
  }

  json get_tables() {
    return query_json(
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema='main' ORDER BY table_name");
  }

  int64_t get_table_count(const std::string &table) {
    return query_single_int("SELECT COUNT(*) FROM " + table);
  }

  // 单引号转义
  static std::string quote(const std::string &s) {
    std::string out = "'";
    for (char c : s) {
      if (c == '\'')
        out += "''";
      else
        out += c;
    }
    out += "'";
    return out;
  }

  // ==========================================================================
  // 审计事件：独立连接自动提交，不随状态事务回滚
  // ==========================================================================
  int64_t append_event(uint64_t ts, const std::string &topic,
                       const std::string &subject, const std::string &payload) {
    std::lock_guard<std::mutex> lock(audit_mutex_);
    auto result = audit_conn_->Query(
        "INSERT INTO event_log (seq, ts, topic, subject, payload) VALUES "
        "(nextval('event_seq'), " +
        std::to_string(ts) + ", " + quote(topic) + ", " + quote(subject) +
        ", " + quote(payload) + ") RETURNING seq");
    if (result->HasError())
      throw std::runtime_error("append_event failed: " + result->GetError());
    return result->GetValue(0, 0).GetValue<int64_t>();
  }

  json recent_events(int64_t limit) {
    std::lock_guard<std::mutex> lock(audit_mutex_);
    return to_json(audit_conn_->Query(
        "SELECT seq, ts, topic, subject, payload FROM event_log "
        "ORDER BY seq DESC LIMIT " +
        std::to_string(limit)));
  }

  void init_schema() {
    // 合约配置：每个合约一个后端身份
    execute(R"(
      CREATE TABLE IF NOT EXISTS contract_config (
        contract TEXT PRIMARY KEY,
        backend_identity TEXT NOT NULL,
        initialized_at BIGINT NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS user_balance (
        user_id TEXT PRIMARY KEY,
        withdrawable HUGEINT NOT NULL,
        locked HUGEINT NOT NULL,
        updated_at BIGINT NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS user_metrics (
        user_id TEXT PRIMARY KEY,
        total_staked HUGEINT NOT NULL,
        total_won HUGEINT NOT NULL,
        total_lost HUGEINT NOT NULL,
        updated_at BIGINT NOT NULL
      )
    )");

    // 幂等记录：ttl_seconds 为 NULL 表示永久
    execute(R"(
      CREATE TABLE IF NOT EXISTS operation_record (
        scope TEXT NOT NULL,
        operation_hash TEXT NOT NULL,
        executed_at BIGINT NOT NULL,
        ttl_seconds BIGINT,
        PRIMARY KEY (scope, operation_hash)
      )
    )");

    // 存在即已结算
    execute(R"(
      CREATE TABLE IF NOT EXISTS settlement_record (
        wager_id TEXT PRIMARY KEY,
        outcome TEXT NOT NULL,
        bettor TEXT NOT NULL,
        winner TEXT,
        staked_amount HUGEINT NOT NULL,
        payout HUGEINT NOT NULL,
        operation_hash TEXT NOT NULL,
        settled_at BIGINT NOT NULL
      )
    )");

    execute("CREATE SEQUENCE IF NOT EXISTS event_seq START 1");
    execute(R"(
      CREATE TABLE IF NOT EXISTS event_log (
        seq BIGINT PRIMARY KEY,
        ts BIGINT NOT NULL,
        topic TEXT NOT NULL,
        subject TEXT NOT NULL,
        payload TEXT NOT NULL
      )
    )");

    execute("CREATE INDEX IF NOT EXISTS idx_event_log_topic ON event_log(topic)");
    execute("CREATE INDEX IF NOT EXISTS idx_settlement_bettor ON settlement_record(bettor)");
  }

private:
  static json to_json(std::unique_ptr<duckdb::MaterializedQueryResult> result) {
    if (result->HasError())
      throw std::runtime_error("query failed: " + result->GetError());

    json rows = json::array();
    auto &types = result->types;
    auto names = result->names;

    for (size_t row = 0; row < result->RowCount(); ++row) {
      json obj = json::object();
      for (size_t col = 0; col < result->ColumnCount(); ++col) {
        auto value = result->GetValue(col, row);
        if (value.IsNull()) {
          obj[names[col]] = nullptr;
        } else {
          switch (types[col].id()) {
          case duckdb::LogicalTypeId::BOOLEAN:
            obj[names[col]] = value.GetValue<bool>();
            break;
          case duckdb::LogicalTypeId::TINYINT:
          case duckdb::LogicalTypeId::SMALLINT:
          case duckdb::LogicalTypeId::INTEGER:
            obj[names[col]] = value.GetValue<int32_t>();
            break;
          case duckdb::LogicalTypeId::BIGINT:
            obj[names[col]] = value.GetValue<int64_t>();
            break;
          case duckdb::LogicalTypeId::FLOAT:
          case duckdb::LogicalTypeId::DOUBLE:
            obj[names[col]] = value.GetValue<double>();
            break;
          default:
            // HUGEINT 等以十进制字符串返回
            obj[names[col]] = value.ToString();
            break;
          }
        }
      }
      rows.push_back(std::move(obj));
    }
    return rows;
  }

  // 路径
  std::string db_path_;
  std::string lock_path_;
  // 文件锁
  int lock_fd_ = -1;
  bool has_write_lock_ = false;
  // DuckDB
  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> conn_;
  std::unique_ptr<duckdb::Connection> audit_conn_;
  std::recursive_mutex mutex_;
  std::mutex audit_mutex_;
  int tx_depth_ = 0;
};
