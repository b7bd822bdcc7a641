#include "crypto/secp256k1.hpp"
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <stdexcept>

namespace {
// One context for the whole process. It is never randomized or otherwise
// mutated after creation, so concurrent signing from relay threads is safe.
class Context {
public:
  Context() : ctx_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY)) {
    if (ctx_ == nullptr) throw std::runtime_error("secp256k1_context_create failed");
  }
  ~Context() { secp256k1_context_destroy(ctx_); }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;
  const secp256k1_context* get() const { return ctx_; }
private:
  secp256k1_context* ctx_;
};

const secp256k1_context* Ctx() {
  static const Context ctx;
  return ctx.get();
}
}

namespace Crypto {
  Bytes RecoverableSignature::ToRsv() const {
    Bytes out;
    out.reserve(65);
    out.insert(out.end(), r.begin(), r.end());
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(static_cast<unsigned char>(27 + recovery_id));
    return out;
  }

  bool IsValidPrivateKey(const Bytes& priv32) {
    return priv32.size() == 32 && secp256k1_ec_seckey_verify(Ctx(), priv32.data()) == 1;
  }

  RecoverableSignature SignDigest(const Bytes& priv32, const Bytes& digest32) {
    if (!IsValidPrivateKey(priv32)) throw std::invalid_argument("invalid secp256k1 private key");
    if (digest32.size() != 32) throw std::invalid_argument("digest must be 32 bytes");
    secp256k1_ecdsa_recoverable_signature raw;
    if (secp256k1_ecdsa_sign_recoverable(Ctx(), &raw, digest32.data(), priv32.data(), nullptr, nullptr) != 1)
      throw std::runtime_error("secp256k1 signing failed");

    unsigned char compact[64];
    RecoverableSignature sig;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(Ctx(), compact, &sig.recovery_id, &raw);
    sig.r.assign(compact, compact + 32);
    sig.s.assign(compact + 32, compact + 64);
    return sig;
  }

  Bytes PublicKeyFromPrivate(const Bytes& priv32) {
    if (!IsValidPrivateKey(priv32)) throw std::invalid_argument("invalid secp256k1 private key");
    secp256k1_pubkey pub;
    if (secp256k1_ec_pubkey_create(Ctx(), &pub, priv32.data()) != 1)
      throw std::runtime_error("secp256k1 public key derivation failed");
    Bytes out(65);
    size_t len = out.size();
    secp256k1_ec_pubkey_serialize(Ctx(), out.data(), &len, &pub, SECP256K1_EC_UNCOMPRESSED);
    return out;
  }
}
