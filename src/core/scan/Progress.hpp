#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace zipcat {

enum class ProgressKind {
  Heartbeat,       // periodic, while a job is busy
  ArchiveIndexed,
  JobFinished,
  Merged,
  Extracting,      // throughput update for one pair
  Extracted
};

const char* to_string(ProgressKind k);

struct ProgressEvent {
  ProgressKind kind = ProgressKind::Heartbeat;
  std::string  job_id;            // volume label, or "extract"
  int64_t      archives = 0;
  int64_t      entries = 0;
  double       elapsed_seconds = 0.0;
  std::optional<std::string> current_file;
  std::optional<int64_t>     current_size;
  int64_t      bytes = 0;
  double       bytes_per_second = 0.0;
};

// Sink for progress events. Implementations must accept calls from several
// worker threads at once.
class ProgressReporter {
public:
  virtual ~ProgressReporter() = default;
  virtual void report(const ProgressEvent& ev) = 0;
};

// Writes events to the default spdlog logger.
class LogProgressReporter : public ProgressReporter {
public:
  void report(const ProgressEvent& ev) override;
};

class NullProgressReporter : public ProgressReporter {
public:
  void report(const ProgressEvent&) override {}
};

// Time-based throttle: due() turns true at most once per interval. The first
// call only arms the timer.
class Heartbeat {
public:
  explicit Heartbeat(std::chrono::milliseconds interval) : interval_(interval) {}

  bool due() {
    const auto now = std::chrono::steady_clock::now();
    if (!armed_) { armed_ = true; last_ = now; return false; }
    if (now - last_ < interval_) return false;
    last_ = now;
    return true;
  }
  void reset() { armed_ = false; }

private:
  std::chrono::milliseconds interval_;
  std::chrono::steady_clock::time_point last_{};
  bool armed_ = false;
};

} // namespace zipcat
