#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

#include "api/api_server.hpp"
#include "api/contract_router.hpp"
#include "core/auth.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/database.hpp"
#include "core/event_log.hpp"
#include "idempotency/engine.hpp"
#include "ledger/balance_ledger.hpp"
#include "settlement/orchestrator.hpp"

void print_usage(const char *prog) {
  std::cout << "用法: " << prog << " --config <config.json>" << std::endl;
}

// 配置了 backend_identity 时，未初始化的合约在启动时绑定该身份
template <class Contract>
void ensure_initialized(Contract &contract, const char *name, const std::string &identity) {
  auto current = contract.backend();
  if (!current) {
    auto r = contract.initialize(identity);
    if (!r)
      throw std::runtime_error(std::string(name) + " 初始化失败: " + r.error().message());
    std::cout << "[Main] " << name << " 已绑定后端 " << identity << std::endl;
  } else if (*current != identity) {
    std::cerr << "[Main] " << name << " 已绑定其他后端 " << *current
              << "，忽略配置中的 " << identity << std::endl;
  }
}

int run(const Config &config) {
  Database db(config.db_path);
  Database::WriteLock write_lock(db);
  db.init_schema();

  SystemClock clock;
  EventLog events(db, clock, config.log_events);
  IdentityProofVerifier verifier;

  ledger::BalanceLedger ledger(db, clock, events, verifier);
  idempotency::Engine idempotency(db, clock, events);
  settlement::Orchestrator settlement(db, clock, events, verifier, ledger, idempotency,
                                      config.compensate_partial_settlement);

  if (config.backend_identity) {
    ensure_initialized(ledger, ledger::BalanceLedger::CONTRACT, *config.backend_identity);
    ensure_initialized(settlement, settlement::Orchestrator::CONTRACT,
                       *config.backend_identity);
  }

  api::ContractRouter router(db, events, ledger, idempotency, settlement, config);

  boost::asio::io_context api_ioc;
  ApiServer api_server(api_ioc, router, static_cast<unsigned short>(config.api_port));

  boost::asio::signal_set signals(api_ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &, int) {
    std::cout << "\n[Main] 正在关闭..." << std::endl;
    api_ioc.stop();
  });

  std::cout << "[Main] 服务已启动" << std::endl;
  api_ioc.run();
  return 0;
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    Wager Core" << std::endl;
  std::cout << "========================================" << std::endl;

  try {
    Config config = Config::load(config_path);

    std::cout << "[Main] DB Path: " << config.db_path << std::endl;
    std::cout << "[Main] API Port: " << config.api_port << std::endl;
    std::cout << "[Main] Backend: "
              << (config.backend_identity ? *config.backend_identity : "<未配置>") << std::endl;
    if (config.default_operation_ttl_seconds)
      std::cout << "[Main] Default TTL: " << *config.default_operation_ttl_seconds << "s"
                << std::endl;
    std::cout << "[Main] Compensate partial settlement: "
              << (config.compensate_partial_settlement ? "on" : "off") << std::endl;

    int rc = run(config);
    std::cout << "[Main] 已退出" << std::endl;
    return rc;
  } catch (const std::exception &e) {
    std::cerr << "[Main] 启动失败: " << e.what() << std::endl;
    return 1;
  }
}
