#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <unistd.h>

namespace asim::sim::prog {
struct Bar {
  std::int64_t total_steps = 1;
  std::chrono::steady_clock::time_point t0{};
  bool is_tty = false;
  int  last_drawn = -1;   // last integer percent drawn

  void start(std::int64_t steps) {
    total_steps = std::max<std::int64_t>(1, steps);
    t0 = std::chrono::steady_clock::now();
    is_tty = ::isatty(::fileno(stderr));
    last_drawn = -1;
  }
  void update(std::int64_t step) {
    if (!is_tty) return;               // no redraw spam under ctest/redirection
    int pct = int( (100.0 * double(step)) / double(total_steps) );
    pct = std::clamp(pct, 0, 100);
    if (pct == last_drawn) return;     // avoid overhead
    last_drawn = pct;
    const int width = 40;
    int fill = (pct * width) / 100;
    auto now = std::chrono::steady_clock::now();
    double dt  = std::chrono::duration<double>(now - t0).count();
    double eta = (pct>0) ? dt*(100.0/pct - 1.0) : 0.0;
    std::fprintf(stderr, "\r[");
    for (int i=0;i<width;i++) std::fputc(i<fill ? '=' : ' ', stderr);
    std::fprintf(stderr, "] %3d%%  step=%lld  t=%.1fs  ETA=%.1fs", pct,
                 static_cast<long long>(step), dt, eta);
    std::fflush(stderr);
  }
  void finish() {
    if (!is_tty) return;
    update(total_steps);
    std::fprintf(stderr, "\n");
  }
};
} // namespace asim::sim::prog
