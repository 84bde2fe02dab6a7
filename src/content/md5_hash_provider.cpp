#include "content/collaborators.hpp"
#include "store/store_error.hpp"
#include <openssl/evp.h>

namespace memblob::content {

//==================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//==================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw store::ContentError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

} // namespace

store::Bytes Md5HashProvider::digest(const store::Bytes& data) const {
  DigestContext context;

  if (!EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr)) {
    throw store::ContentError("Failed to initialize MD5 context");
  }

  if (!data.empty() && !EVP_DigestUpdate(context.get(), data.data(), data.size())) {
    throw store::ContentError("Failed to update MD5 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    throw store::ContentError("Failed to finalize MD5 digest");
  }

  return store::Bytes(hash, hash + hash_len);
}

} // namespace memblob::content
