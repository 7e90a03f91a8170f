#include "kv_cache/cache.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>

using namespace kv_cache;

int main() {
  spdlog::set_level(spdlog::level::warn);
  const std::vector<std::string> stores = {"memory", "volatile"};
  const std::vector<std::string> presets = {"hotset", "uniform", "writeheavy",
                                            "sliding"};

  for (const auto &preset : presets) {
    std::cout << "workload=" << preset << "\n";
    for (const auto &sname : stores) {
      CacheSettings settings;
      settings.store = sname;
      Cache cache(settings, make_store_by_name(sname, settings));
      std::mt19937_64 rng(42);
      std::uniform_int_distribution<int> u(0, 999);
      const int ops = 10000;
      auto start = std::chrono::steady_clock::now();
      int hits = 0;
      std::vector<double> lat;
      lat.reserve(ops);
      for (int i = 0; i < ops; ++i) {
        auto t0 = std::chrono::steady_clock::now();
        int k = u(rng);
        if (preset == "hotset")
          k = static_cast<int>(std::pow((u(rng) % 100) + 1, 1.4));
        const std::string partition = "p" + std::to_string(k % 8);
        const std::string key = "k" + std::to_string(k % 1000);
        const bool do_write =
            preset == "writeheavy" ? (i % 2 == 0) : (i % 5 == 0);
        if (do_write) {
          std::string v(64, static_cast<char>('a' + i % 26));
          if (preset == "sliding")
            cache.add_sliding(partition, key, v, std::chrono::minutes(10));
          else
            cache.add_static(partition, key, v);
        } else {
          if (cache.get<std::string>(partition, key).has_value())
            ++hits;
        }
        auto t1 = std::chrono::steady_clock::now();
        lat.push_back(
            std::chrono::duration<double, std::micro>(t1 - t0).count());
      }
      auto end = std::chrono::steady_clock::now();
      std::sort(lat.begin(), lat.end());
      auto pct = [&](double p) {
        return lat[static_cast<std::size_t>(p * (lat.size() - 1))];
      };
      double seconds = std::chrono::duration<double>(end - start).count();
      std::cout << "store=" << sname << " ops/s=" << std::fixed
                << std::setprecision(2) << (ops / seconds)
                << " p50_us=" << pct(0.50) << " p95_us=" << pct(0.95)
                << " p99_us=" << pct(0.99)
                << " hit_rate=" << (static_cast<double>(hits) / ops)
                << " items=" << cache.long_count()
                << " bytes=" << cache.cache_size_bytes() << "\n";
    }
  }
  return 0;
}
