#include <nosj/nosj.hpp>

#include "log.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

// Unique lowercase key for each index: a, b, ..., z, ba, bb, ...
std::string key_for(std::size_t i) {
  std::string k;
  do {
    k.push_back(static_cast<char>('a' + (i % 26)));
    i /= 26;
  } while (i != 0);
  std::reverse(k.begin(), k.end());
  return k;
}

std::string make_payload(std::size_t n_entries, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');
  std::uniform_int_distribution<int> bit(0, 1);

  std::string s;
  s.reserve(n_entries * (str_len + 48));
  s += "(<";
  for (std::size_t i = 0; i < n_entries; ++i) {
    if (i) s.push_back(',');
    s += key_for(i);
    s.push_back(':');
    switch (i % 4) {
      case 0:
        // Keep most strings simple so pure scan cost is visible.
        for (std::size_t k = 0; k < str_len; ++k) s.push_back(static_cast<char>(ch(rng)));
        s.push_back('s');
        break;
      case 1:
        for (std::size_t k = 0; k < 32; ++k) s.push_back(bit(rng) ? '1' : '0');
        break;
      case 2:
        s += "ab%2Ccd%3Aef%3C%3E";
        break;
      default:
        s += "(<id:0110,name:some names,deep:(<x:1000>)>)";
        break;
    }
  }
  s += ">)";
  return s;
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    bytes = br.bytes;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], bytes};
}

bench_result bench_parse_events(std::string_view text, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = nosj::parse(text);
    do_not_optimize(r.err.code);
    do_not_optimize(r.events.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, text.size() * iters};
}

bench_result bench_parse_and_dump(std::string_view text, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = nosj::parse(text);
    auto out = nosj::dump_events(r.events);
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, text.size() * iters};
}

bench_result bench_marshal(std::string_view text, std::size_t iters) {
  auto r = nosj::parse_value(text);
  if (r.err) {
    NOSJ_LOG_ERROR("input parse failed: %s", nosj::error_message(r.err.code));
    std::exit(1);
  }

  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    auto out = nosj::marshal(r.val);
    bytes += out.size();
    do_not_optimize(out.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, bytes};
}

void print_mbps(const char* name, const bench_result& r) {
  const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  NOSJ_LOG_INFO("%s: %.2f MiB/s (%.4f s)", name, mbps, r.seconds);
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_entries = 4000;
  std::size_t str_len = 24;
  std::size_t iters = 100;
  std::size_t runs = 5;

  if (argc >= 2) n_entries = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = make_payload(n_entries, str_len);
  NOSJ_LOG_INFO("payload bytes: %zu", payload.size());

  // Warm-up
  {
    auto r = nosj::parse(payload);
    if (r.err) {
      NOSJ_LOG_ERROR("payload rejected: %s", nosj::error_message(r.err.code));
      return 1;
    }
    do_not_optimize(r.events.size());
  }

  print_mbps("parse(events)", run_median(runs, [&] { return bench_parse_events(payload, iters); }));
  print_mbps("parse+dump(lines)", run_median(runs, [&] { return bench_parse_and_dump(payload, iters); }));
  print_mbps("marshal(dom)", run_median(runs, [&] { return bench_marshal(payload, iters); }));

  return 0;
}
