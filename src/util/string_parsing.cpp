// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <nlohmann/json.hpp>

namespace ziacoin {
namespace util {

namespace {

bool HasLeadingSpace(const std::string &str) {
  return str.empty() || std::isspace(static_cast<unsigned char>(str[0]));
}

} // namespace

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max) {
  if (HasLeadingSpace(str)) {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  const long long value = std::strtoll(str.c_str(), &end, 10);
  if (errno == ERANGE || end != str.c_str() + str.size()) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return static_cast<int64_t>(value);
}

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string &str) {
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<double> SafeParseDouble(const std::string &str) {
  if (HasLeadingSpace(str)) {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  const double value = std::strtod(str.c_str(), &end);
  if (errno == ERANGE || end != str.c_str() + str.size() ||
      !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

bool IsValidHex(const std::string &str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::string HexStr(const uint8_t *data, size_t len) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0f]);
  }
  return out;
}

std::string HexStr(const std::vector<uint8_t> &data) {
  return HexStr(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> ParseHex(const std::string &str) {
  if (str.size() % 2 != 0 || (!str.empty() && !IsValidHex(str))) {
    return std::nullopt;
  }
  auto nibble = [](char c) -> uint8_t {
    if (c >= '0' && c <= '9') {
      return static_cast<uint8_t>(c - '0');
    }
    return static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) -
                                'a' + 10);
  };
  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    out.push_back(static_cast<uint8_t>((nibble(str[i]) << 4) |
                                       nibble(str[i + 1])));
  }
  return out;
}

std::optional<std::pair<std::string, uint16_t>>
ParseHostPort(const std::string &str) {
  const auto colon = str.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    return std::nullopt;
  }
  auto port = SafeParsePort(str.substr(colon + 1));
  if (!port) {
    return std::nullopt;
  }
  return std::make_pair(str.substr(0, colon), *port);
}

std::vector<std::string> SplitString(const std::string &str, char sep) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= str.size()) {
    const size_t pos = str.find(sep, start);
    const size_t end = pos == std::string::npos ? str.size() : pos;
    if (end > start) {
      out.push_back(str.substr(start, end - start));
    }
    if (pos == std::string::npos) {
      break;
    }
    start = pos + 1;
  }
  return out;
}

std::string JsonError(const std::string &message) {
  nlohmann::json j;
  j["error"] = message;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
         "\n";
}

std::string JsonSuccess(const std::string &result) {
  nlohmann::json j;
  j["result"] = result;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
         "\n";
}

} // namespace util
} // namespace ziacoin
