#pragma once
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

using Bytes = std::vector<unsigned char>;

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

inline int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  return -1;
}

// Throws std::invalid_argument on odd length or a non-hex digit.
inline Bytes HexToBytes(const std::string& hex) {
  std::string h = Strip0x(hex);
  if (h.size() % 2 != 0) throw std::invalid_argument("odd-length hex string");
  Bytes out; out.reserve(h.size() / 2);
  for (size_t i = 0; i < h.size(); i += 2) {
    int hi = HexNibble(h[i]), lo = HexNibble(h[i + 1]);
    if (hi < 0 || lo < 0) throw std::invalid_argument("invalid hex digit in: " + hex);
    out.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return out;
}

inline std::string BytesToHex0x(const unsigned char* data, size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out; out.reserve(2 * len + 2); out += "0x";
  for (size_t i = 0; i < len; ++i) { out += hex[data[i] >> 4]; out += hex[data[i] & 0xF]; }
  return out;
}

inline std::string BytesToHex0x(const Bytes& data) {
  return BytesToHex0x(data.data(), data.size());
}

// JSON-RPC quantity: 0x-prefixed, no leading zeros, "0x0" for zero.
inline std::string ToHexQuantity(unsigned long long value) {
  static const char* hex = "0123456789abcdef";
  if (value == 0) return "0x0";
  std::string digits;
  while (value) { digits.insert(digits.begin(), hex[value & 0xF]); value >>= 4; }
  return "0x" + digits;
}

inline unsigned long long ParseHexQuantity(const std::string& s) {
  std::string h = Strip0x(s);
  if (h.empty() || h.size() > 16) throw std::invalid_argument("invalid hex quantity: " + s);
  unsigned long long v = 0;
  for (char c : h) {
    int n = HexNibble(c);
    if (n < 0) throw std::invalid_argument("invalid hex quantity: " + s);
    v = (v << 4) | static_cast<unsigned long long>(n);
  }
  return v;
}

inline bool IsHexOfLength(const std::string& s, size_t bytes) {
  std::string h = Strip0x(s);
  if (h.size() != bytes * 2) return false;
  return std::all_of(h.begin(), h.end(), [](char c){ return HexNibble(c) >= 0; });
}

// Canonical form used for map keys and comparisons: 0x + 40 lower-case digits.
inline std::string NormalizeAddress(const std::string& addr) {
  if (!IsHexOfLength(addr, 20)) throw std::invalid_argument("invalid address: " + addr);
  return "0x" + ToLowerHex(Strip0x(addr));
}

inline std::string NormalizeHash(const std::string& hash) {
  if (!IsHexOfLength(hash, 32)) throw std::invalid_argument("invalid hash: " + hash);
  return "0x" + ToLowerHex(Strip0x(hash));
}
