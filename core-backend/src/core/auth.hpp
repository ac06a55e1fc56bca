#pragma once

// ============================================================================
// 后端授权 - 每个合约只认一个后端身份，初始化一次
// ============================================================================

#include <optional>
#include <string>
#include <utility>

#include "clock.hpp"
#include "database.hpp"
#include "errors.hpp"
#include "event_log.hpp"
#include "types.hpp"

// 调用方出示的来源证明
struct AuthProof {
  core::Identity identity;
  std::string signature;
};

// 签名校验钩子，真正的密码学校验由宿主完成
class ProofVerifier {
public:
  virtual ~ProofVerifier() = default;
  virtual bool verify(const AuthProof &proof,
                      const core::Identity &expected) const = 0;
};

class IdentityProofVerifier : public ProofVerifier {
public:
  bool verify(const AuthProof &proof,
              const core::Identity &expected) const override {
    return proof.identity == expected;
  }
};

class BackendAuthority {
public:
  BackendAuthority(Database &db, Clock &clock, EventLog &events,
                   std::string contract, const ProofVerifier &verifier)
      : db_(db), clock_(clock), events_(events), contract_(std::move(contract)),
        verifier_(verifier) {}

  ledger::Result<void> initialize(const core::Identity &identity) {
    auto lock = db_.serialize();
    if (backend())
      return ledger::make_error_code(ledger::Errc::already_initialized);

    db_.execute("INSERT INTO contract_config (contract, backend_identity, "
                "initialized_at) VALUES (" +
                Database::quote(contract_) + ", " + Database::quote(identity) +
                ", " + std::to_string(clock_.now()) + ")");
    events_.publish(topics::CONTRACT_INITIALIZED, contract_,
                    {{"backend", identity}});
    return outcome::success();
  }

  std::optional<core::Identity> backend() {
    auto rows = db_.query_json(
        "SELECT backend_identity FROM contract_config WHERE contract = " +
        Database::quote(contract_));
    if (rows.empty())
      return std::nullopt;
    return rows[0]["backend_identity"].get<std::string>();
  }

  ledger::Result<void> require_auth(const AuthProof &proof) {
    auto stored = backend();
    if (!stored)
      return ledger::make_error_code(ledger::Errc::not_initialized);
    if (proof.identity != *stored || !verifier_.verify(proof, *stored))
      return ledger::make_error_code(ledger::Errc::unauthorized);
    return outcome::success();
  }

private:
  Database &db_;
  Clock &clock_;
  EventLog &events_;
  std::string contract_;
  const ProofVerifier &verifier_;
};
