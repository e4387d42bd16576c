#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

namespace utils {

std::string toHex(const uint8_t* data, size_t length);
std::string toHex(const Bytes& data);
std::optional<Bytes> fromHex(const std::string& hex);

// Lower-case hex SHA-256 digest
std::string sha256Hex(const Bytes& data);
std::optional<std::string> sha256FileHex(const std::string& path);

Bytes randomBytes(size_t count);
std::string randomHex(size_t byteCount);

std::string base64Encode(const Bytes& data);
std::optional<Bytes> base64Decode(const std::string& text);

std::string toUpper(const std::string& str);

int64_t nowSeconds();
// YYYY-MM-DD in local time
std::string localDateString(int64_t epochSeconds);
// ISO-8601 UTC, e.g. 2026-03-01T12:00:00Z
std::string toIso8601(int64_t epochSeconds);
std::optional<int64_t> fromIso8601(const std::string& text);

std::optional<Bytes> readFile(const std::string& path);
bool writeFile(const std::string& path, const Bytes& data);

} // namespace utils
