#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace core {

// ============================================================================
// Amount - 有符号 128 位金额
// ============================================================================
using Amount = __int128;

static constexpr Amount AMOUNT_MAX = static_cast<Amount>(
    (static_cast<unsigned __int128>(1) << 127) - 1);
static constexpr Amount AMOUNT_MIN = -AMOUNT_MAX - 1;

// 溢出时返回 nullopt，绝不回绕
inline std::optional<Amount> checked_add(Amount a, Amount b) {
  Amount out;
  if (__builtin_add_overflow(a, b, &out))
    return std::nullopt;
  return out;
}

inline std::string amount_to_string(Amount v) {
  if (v == 0)
    return "0";
  bool negative = v < 0;
  // 取绝对值时 AMOUNT_MIN 需要走无符号
  unsigned __int128 u = negative ? static_cast<unsigned __int128>(-(v + 1)) + 1
                                 : static_cast<unsigned __int128>(v);
  std::string out;
  while (u > 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
    u /= 10;
  }
  if (negative)
    out.push_back('-');
  std::reverse(out.begin(), out.end());
  return out;
}

inline std::optional<Amount> parse_amount(const std::string &str) {
  if (str.empty())
    return std::nullopt;

  size_t i = 0;
  bool negative = false;
  if (str[0] == '-' || str[0] == '+') {
    negative = str[0] == '-';
    i = 1;
  }
  if (i == str.size())
    return std::nullopt;

  const unsigned __int128 limit =
      negative ? static_cast<unsigned __int128>(AMOUNT_MAX) + 1
               : static_cast<unsigned __int128>(AMOUNT_MAX);
  unsigned __int128 u = 0;
  for (; i < str.size(); ++i) {
    char c = str[i];
    if (c < '0' || c > '9')
      return std::nullopt;
    unsigned digit = static_cast<unsigned>(c - '0');
    if (u > (limit - digit) / 10)
      return std::nullopt;
    u = u * 10 + digit;
  }

  if (negative) {
    if (u == static_cast<unsigned __int128>(AMOUNT_MAX) + 1)
      return AMOUNT_MIN;
    return -static_cast<Amount>(u);
  }
  return static_cast<Amount>(u);
}

// ============================================================================
// 十六进制
// ============================================================================
inline int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

inline std::string strip_0x(const std::string &s) {
  if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
    return s.substr(2);
  return s;
}

template <size_t N> std::string to_hex(const std::array<uint8_t, N> &bytes) {
  static const char *digits = "0123456789abcdef";
  std::string out;
  out.reserve(N * 2);
  for (uint8_t b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0f]);
  }
  return out;
}

// ============================================================================
// Hash32 - 调用方提供的操作哈希
// ============================================================================
struct Hash32 {
  std::array<uint8_t, 32> bytes{};

  static Hash32 filled(uint8_t b) {
    Hash32 h;
    h.bytes.fill(b);
    return h;
  }

  // 必须正好 64 个十六进制字符(可带 0x)
  static std::optional<Hash32> from_hex(const std::string &str) {
    std::string hex = strip_0x(str);
    if (hex.size() != 64)
      return std::nullopt;
    Hash32 h;
    for (size_t i = 0; i < 32; ++i) {
      int hi = hex_value(hex[2 * i]);
      int lo = hex_value(hex[2 * i + 1]);
      if (hi < 0 || lo < 0)
        return std::nullopt;
      h.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return h;
  }

  std::string hex() const { return to_hex(bytes); }

  bool operator==(const Hash32 &) const = default;
};

// ============================================================================
// WagerId - 256 位注单 ID，大端存储
// ============================================================================
struct WagerId {
  std::array<uint8_t, 32> bytes{};

  static WagerId from_uint64(uint64_t v) {
    WagerId id;
    for (int i = 0; i < 8; ++i) {
      id.bytes[31 - i] = static_cast<uint8_t>(v >> (8 * i));
    }
    return id;
  }

  // 支持十进制或 0x 十六进制
  static std::optional<WagerId> parse(const std::string &str) {
    if (str.empty())
      return std::nullopt;

    WagerId id;
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
      std::string hex = str.substr(2);
      if (hex.empty() || hex.size() > 64)
        return std::nullopt;
      hex.insert(0, 64 - hex.size(), '0');
      for (size_t i = 0; i < 32; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0)
          return std::nullopt;
        id.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
      }
      return id;
    }

    for (char c : str) {
      if (c < '0' || c > '9')
        return std::nullopt;
      // bytes = bytes * 10 + digit
      unsigned carry = static_cast<unsigned>(c - '0');
      for (int i = 31; i >= 0; --i) {
        unsigned v = id.bytes[i] * 10u + carry;
        id.bytes[i] = static_cast<uint8_t>(v & 0xff);
        carry = v >> 8;
      }
      if (carry != 0)
        return std::nullopt;
    }
    return id;
  }

  std::string hex() const { return to_hex(bytes); }

  bool operator==(const WagerId &) const = default;
};

// 用户 / 后端身份
using Identity = std::string;

} // namespace core
