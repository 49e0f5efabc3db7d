// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Input parsing for untrusted strings (RPC params, command line, config).

 Every parser requires the whole input to be consumed and returns
 std::nullopt on any error instead of throwing.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ziacoin {
namespace util {

// Integer in [min, max]. "42x", "" and " 42" are rejected.
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max);

// Port in [1, 65535]
std::optional<uint16_t> SafeParsePort(const std::string &str);

// Finite decimal number
std::optional<double> SafeParseDouble(const std::string &str);

// Non-empty and only [0-9a-fA-F]
bool IsValidHex(const std::string &str);

// Lowercase hex of a byte range
std::string HexStr(const uint8_t *data, size_t len);
std::string HexStr(const std::vector<uint8_t> &data);

// Even-length hex to bytes; nullopt on odd length or a non-hex character
std::optional<std::vector<uint8_t>> ParseHex(const std::string &str);

// "host:port" -> {host, port}. The last ':' separates the port.
std::optional<std::pair<std::string, uint16_t>>
ParseHostPort(const std::string &str);

// Splits on `sep`, dropping empty pieces
std::vector<std::string> SplitString(const std::string &str, char sep);

// {"error":"<message>"}\n
std::string JsonError(const std::string &message);

// {"result":"<result>"}\n
std::string JsonSuccess(const std::string &result);

} // namespace util
} // namespace ziacoin
