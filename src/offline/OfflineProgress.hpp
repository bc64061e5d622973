#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>

// Global inline controls for offline progress reporting
inline int gOfflineProgressMs = 100;      // print progress roughly every N ms (<=0 disables)
inline bool gOfflineProgressEnabled = true; // master switch
inline bool gOfflineSummaryEnabled = true;  // print final speedup summary line

// Rate-limited "[offline] NN%" line on stderr.
class OfflineProgress {
public:
  OfflineProgress() : start_(std::chrono::steady_clock::now()), last_(start_) {}

  void update(uint64_t done, uint64_t total) {
    if (!gOfflineProgressEnabled || gOfflineProgressMs <= 0 || total == 0) return;
    const auto now = std::chrono::steady_clock::now();
    const auto msSince = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_).count();
    if (msSince < gOfflineProgressMs && done < total) return;
    std::fprintf(stderr, "[offline] %3.0f%%\r", 100.0 * static_cast<double>(done) / static_cast<double>(total));
    last_ = now;
  }

  // audioSeconds is the duration of the processed input.
  void finish(double audioSeconds) const {
    const double sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    if (!gOfflineSummaryEnabled || audioSeconds <= 0.0) return;
    if (sec > 0.0) std::fprintf(stderr, "[offline] done in %.3fs (speedup %.1fx)    \n", sec, audioSeconds / sec);
    else std::fprintf(stderr, "[offline] done    \n");
  }

private:
  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point last_;
};
