#include "Hash.hpp"

#include <fstream>
#include <vector>

#include <openssl/evp.h>

#include "core/Errors.hpp"
#include "core/util/Ids.hpp"

namespace zipcat {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_ || EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
}

Sha256::~Sha256() {
  EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
}

void Sha256::update(const void* data, size_t len) {
  if (finished_) throw std::logic_error("Sha256::update after hexdigest");
  if (len == 0) return;
  if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1)
    throw std::runtime_error("EVP_DigestUpdate failed");
}

std::string Sha256::hexdigest() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int n = 0;
  if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), md, &n) != 1)
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  finished_ = true;
  return to_hex(md, n);
}

std::string sha256_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw CatalogError(ErrorCode::IOFailure, "cannot open for hashing: " + path);

  Sha256 h;
  std::vector<char> buf(1 << 20);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto got = in.gcount();
    if (got > 0) h.update(buf.data(), static_cast<size_t>(got));
  }
  if (in.bad()) throw CatalogError(ErrorCode::IOFailure, "read failed while hashing: " + path);
  return h.hexdigest();
}

} // namespace zipcat
