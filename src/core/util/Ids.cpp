#include "Ids.hpp"

#include <chrono>
#include <ctime>
#include <random>

namespace zipcat {

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::string uuid4() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  uint64_t a = rng(), b = rng();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx...
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

int64_t now_epoch() {
  return static_cast<int64_t>(std::time(nullptr));
}

int64_t file_time_to_epoch(std::filesystem::file_time_type t) {
  using namespace std::chrono;
  const auto sys = system_clock::now() +
                   duration_cast<system_clock::duration>(t - std::filesystem::file_time_type::clock::now());
  return duration_cast<seconds>(sys.time_since_epoch()).count();
}

} // namespace zipcat
