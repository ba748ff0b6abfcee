#include "tpe/position_id.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace tpe {

namespace {

inline void put_be64(uint8_t* out, uint64_t v) {
  for (int i = 7; i >= 0; --i) { out[i] = static_cast<uint8_t>(v & 0xff); v >>= 8; }
}

} // namespace

PositionId make_position_id(MarketId market, Tick tick, Direction dir) {
  uint8_t buf[17];
  put_be64(buf, market);
  put_be64(buf + 8, static_cast<uint64_t>(tick)); // two's complement
  buf[16] = static_cast<uint8_t>(dir);

  PositionId id;
  unsigned int len = 0;
  if (EVP_Digest(buf, sizeof(buf), id.bytes.data(), &len, EVP_sha256(), nullptr) != 1 ||
      len != id.bytes.size()) {
    // libcrypto cannot produce SHA-256: nothing sensible to key positions by
    throw std::runtime_error("tpe: EVP_Digest(sha256) failed");
  }
  return id;
}

std::string PositionId::hex() const {
  static const char* digits = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0f]);
  }
  return out;
}

} // namespace tpe
