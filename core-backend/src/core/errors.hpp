#pragma once

// ============================================================================
// 错误码 - 所有合约入口统一返回 outcome::result<T>
// ============================================================================

#include <string>
#include <type_traits>

#include <boost/outcome.hpp>
#include <boost/system/error_code.hpp>

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

namespace ledger {

// 数值即对外错误码，不可重排
enum class Errc : int {
  unauthorized = 1,
  already_initialized = 2,
  not_initialized = 3,
  invalid_amount = 4,
  insufficient_withdrawable = 5,
  insufficient_locked = 6,
  overflow = 7,
  invalid_bet = 8,
  invalid_status = 9,
  bet_already_settled = 10,
  duplicate_operation = 11,
};

inline const char *errc_name(Errc e) {
  switch (e) {
  case Errc::unauthorized:
    return "unauthorized";
  case Errc::already_initialized:
    return "already_initialized";
  case Errc::not_initialized:
    return "not_initialized";
  case Errc::invalid_amount:
    return "invalid_amount";
  case Errc::insufficient_withdrawable:
    return "insufficient_withdrawable";
  case Errc::insufficient_locked:
    return "insufficient_locked";
  case Errc::overflow:
    return "overflow";
  case Errc::invalid_bet:
    return "invalid_bet";
  case Errc::invalid_status:
    return "invalid_status";
  case Errc::bet_already_settled:
    return "bet_already_settled";
  case Errc::duplicate_operation:
    return "duplicate_operation";
  }
  return "unknown";
}

class ErrcCategory : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "wager-ledger"; }

  std::string message(int ev) const override {
    return errc_name(static_cast<Errc>(ev));
  }
};

inline const boost::system::error_category &errc_category() {
  static const ErrcCategory category{};
  return category;
}

inline boost::system::error_code make_error_code(Errc e) {
  return {static_cast<int>(e), errc_category()};
}

template <class T> using Result = outcome::result<T>;

} // namespace ledger

namespace boost::system {
template <> struct is_error_code_enum<ledger::Errc> : std::true_type {};
} // namespace boost::system
