#pragma once
/*
================================================================================
Fragment 1.5 — Core: Canonical Digest Utilities (SHA-256)
FILE: cpp/riskgate/core/hashing.hpp

Purpose:
  - Provide a stable, cryptographic content digest for:
      * input fingerprints (audit identity key of a RiskInput)
      * policy fingerprints (identity of a frozen policy configuration)
      * seal digests (identity of a sealed AuditRecord)

Design constraints:
  - Determinism > speed.
  - No dependence on std::hash (not stable across processes/platforms).
  - Every value is fed through a typed update_* call with a defined byte
    encoding, so the digest is a function of field values only.

Hardening:
  - Integers encoded little-endian regardless of host byte order.
  - Strings are length-delimited (u64 LE length, then bytes).
  - Doubles hashed via bit pattern AFTER canonicalization
    (-0.0 -> +0.0, NaN -> fixed quiet-NaN payload).
  - OpenSSL EVP failures raise ErrorCode::kCrypto, never a silent zero digest.
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

struct evp_md_ctx_st;

namespace riskgate {

// ----------------------------- Digest256 -------------------------------------
struct Digest256 {
  std::array<std::uint8_t, 32> bytes{};

  bool operator==(const Digest256& o) const noexcept { return bytes == o.bytes; }
  bool operator!=(const Digest256& o) const noexcept { return bytes != o.bytes; }
};

// ----------------------------- Sha256Hasher ----------------------------------
// Streaming SHA-256 with typed, canonical update helpers.
// One hasher produces one digest; updates after finish() are a defect.
class Sha256Hasher {
 public:
  Sha256Hasher();
  ~Sha256Hasher();

  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;

  void update_bytes(const void* data, std::size_t n);

  void update_u8(std::uint8_t v) { update_bytes(&v, 1); }

  void update_u32(std::uint32_t v) { update_le(v); }
  void update_u64(std::uint64_t v) { update_le(v); }
  void update_i32(std::int32_t v)  { update_le(static_cast<std::uint32_t>(v)); }
  void update_i64(std::int64_t v)  { update_le(static_cast<std::uint64_t>(v)); }

  void update_bool(bool b) { update_u8(static_cast<std::uint8_t>(b ? 1 : 0)); }

  // Length delimiter avoids "ab"+"c" == "a"+"bc" ambiguity.
  void update_string(std::string_view s);

  template <class E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
  void update_enum(E e) {
    using U = std::underlying_type_t<E>;
    if constexpr (sizeof(U) <= 4) update_u32(static_cast<std::uint32_t>(static_cast<U>(e)));
    else update_u64(static_cast<std::uint64_t>(static_cast<U>(e)));
  }

  void update_f64(double x);

  // Section tag + unit separator; keeps schema additions detectable.
  void update_tag(std::string_view tag);

  Digest256 finish();

 private:
  template <class T>
  void update_le(T v) {
    static_assert(std::is_integral_v<T> && (sizeof(T) == 4 || sizeof(T) == 8),
                  "update_le supports 32/64-bit integral types only");
    std::array<std::uint8_t, sizeof(T)> b{};
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      b[i] = static_cast<std::uint8_t>((static_cast<std::uint64_t>(v) >> (8 * i)) & 0xFFu);
    }
    update_bytes(b.data(), b.size());
  }

  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const noexcept;
  };

  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
  bool finished_ = false;
};

// One-shot digest of a byte string.
Digest256 sha256(std::string_view data);

// Lowercase hex, 64 chars, most significant byte first.
std::string digest_to_hex(const Digest256& d);

}  // namespace riskgate
