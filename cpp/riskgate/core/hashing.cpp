#include "riskgate/core/hashing.hpp"

#include "riskgate/core/error.hpp"

#include <openssl/evp.h>

#include <bit>
#include <cmath>

namespace riskgate {

namespace {

constexpr std::uint64_t kCanonicalQuietNaNBits = 0x7ff8000000000000ull;

double canonicalize_f64(double v) {
  if (std::isnan(v)) return std::bit_cast<double>(kCanonicalQuietNaNBits);
  if (v == 0.0) return 0.0;  // folds -0.0
  return v;
}

}  // namespace

void Sha256Hasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
  RISKGATE_ENSURE(ctx_ != nullptr, ErrorCode::kCrypto, "EVP_MD_CTX_new failed");
  RISKGATE_ENSURE(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1,
                  ErrorCode::kCrypto, "EVP_DigestInit_ex(sha256) failed");
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::update_bytes(const void* data, std::size_t n) {
  RISKGATE_ENSURE(!finished_, ErrorCode::kInternalInvariant, "Sha256Hasher updated after finish()");
  if (data == nullptr || n == 0) return;
  RISKGATE_ENSURE(EVP_DigestUpdate(ctx_.get(), data, n) == 1,
                  ErrorCode::kCrypto, "EVP_DigestUpdate failed");
}

void Sha256Hasher::update_string(std::string_view s) {
  update_u64(static_cast<std::uint64_t>(s.size()));
  if (!s.empty()) update_bytes(s.data(), s.size());
}

void Sha256Hasher::update_f64(double x) {
  update_u64(std::bit_cast<std::uint64_t>(canonicalize_f64(x)));
}

void Sha256Hasher::update_tag(std::string_view tag) {
  update_string(tag);
  update_u8(0x1F);
}

Digest256 Sha256Hasher::finish() {
  RISKGATE_ENSURE(!finished_, ErrorCode::kInternalInvariant, "Sha256Hasher finished twice");
  finished_ = true;

  Digest256 out;
  unsigned int len = 0;
  RISKGATE_ENSURE(EVP_DigestFinal_ex(ctx_.get(), out.bytes.data(), &len) == 1,
                  ErrorCode::kCrypto, "EVP_DigestFinal_ex failed");
  RISKGATE_ENSURE(len == out.bytes.size(), ErrorCode::kCrypto, "unexpected SHA-256 digest length");
  return out;
}

Digest256 sha256(std::string_view data) {
  Sha256Hasher h;
  if (!data.empty()) h.update_bytes(data.data(), data.size());
  return h.finish();
}

std::string digest_to_hex(const Digest256& d) {
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.resize(d.bytes.size() * 2);
  for (std::size_t i = 0; i < d.bytes.size(); ++i) {
    out[2 * i]     = kHex[(d.bytes[i] >> 4) & 0xF];
    out[2 * i + 1] = kHex[d.bytes[i] & 0xF];
  }
  return out;
}

}  // namespace riskgate
