#pragma once
#include <cstddef>
#include <string>

namespace zipcat {

// Incremental SHA-256 over OpenSSL's EVP interface.
class Sha256 {
public:
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const void* data, size_t len);
  std::string hexdigest();   // finalizes; the object cannot be updated afterwards

private:
  void* ctx_; // EVP_MD_CTX*
  bool finished_ = false;
};

// Hash of a whole file, read in bounded chunks. Throws CatalogError(IOFailure).
std::string sha256_file(const std::string& path);

} // namespace zipcat
