#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace zipcat {

// Random (version 4) UUID, lower-case canonical form.
std::string uuid4();

std::string to_hex(const uint8_t* data, size_t len);

int64_t now_epoch();
int64_t file_time_to_epoch(std::filesystem::file_time_type t);

} // namespace zipcat
