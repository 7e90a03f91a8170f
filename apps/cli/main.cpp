#include "kv_cache/cache.hpp"
#include "kv_cache/sqlite_store.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace kv_cache;

namespace {
std::vector<std::string> split(const std::string &line) {
  std::istringstream in(line);
  std::vector<std::string> out;
  std::string word;
  while (in >> word)
    out.push_back(word);
  return out;
}

std::string format_time(TimePoint t) {
  return std::to_string(to_epoch_ms(t)) + "ms";
}

void print_help() {
  std::cout
      << "add <partition> <key> <value> [sliding <s>|static|timed <s>] "
         "[parent...]\n"
      << "get|peek|item|del|contains <partition> <key>\n"
      << "count [partition]\n"
      << "clear [partition] [expired]\n"
      << "size | vacuum | lasterror | help | quit\n";
}

// add p k v [policy args] [parents]
void run_add(Cache &cache, const std::vector<std::string> &args) {
  if (args.size() < 4) {
    std::cout << "ERR usage: add <partition> <key> <value> ...\n";
    return;
  }
  ExpiryPolicy policy = ExpiryPolicy::fixed_static();
  std::size_t next = 4;
  if (next < args.size()) {
    if (args[next] == "sliding" && next + 1 < args.size()) {
      policy = ExpiryPolicy::sliding(std::chrono::seconds(std::stoll(args[next + 1])));
      next += 2;
    } else if (args[next] == "timed" && next + 1 < args.size()) {
      policy = ExpiryPolicy::timed_for(std::chrono::seconds(std::stoll(args[next + 1])));
      next += 2;
    } else if (args[next] == "static") {
      ++next;
    }
  }
  std::vector<std::string> parents(args.begin() + static_cast<long>(next),
                                   args.end());
  cache.add(args[1], args[2], args[3], policy, parents);
  std::cout << "OK\n";
}

void run_command(Cache &cache, SqliteStore *sqlite,
                 const std::vector<std::string> &args) {
  const auto &cmd = args[0];
  if (cmd == "help") {
    print_help();
  } else if (cmd == "add") {
    run_add(cache, args);
  } else if ((cmd == "get" || cmd == "peek") && args.size() == 3) {
    const auto v = cmd == "get" ? cache.get<std::string>(args[1], args[2])
                                : cache.peek<std::string>(args[1], args[2]);
    std::cout << (v ? *v : std::string("(nil)")) << "\n";
  } else if (cmd == "item" && args.size() == 3) {
    const auto item = cache.peek_item<std::string>(args[1], args[2]);
    if (!item) {
      std::cout << "(nil)\n";
      return;
    }
    std::cout << "value=" << item->value
              << " created=" << format_time(item->utc_creation)
              << " expiry=" << format_time(item->utc_expiry)
              << " interval=" << item->interval.count() << "ms"
              << " parents=" << item->parent_keys.size() << "\n";
  } else if (cmd == "del" && args.size() == 3) {
    cache.remove(args[1], args[2]);
    std::cout << "OK\n";
  } else if (cmd == "contains" && args.size() == 3) {
    std::cout << (cache.contains(args[1], args[2]) ? "1" : "0") << "\n";
  } else if (cmd == "count") {
    std::cout << (args.size() > 1 ? cache.long_count(args[1])
                                  : cache.long_count())
              << "\n";
  } else if (cmd == "clear") {
    const bool expired_only = !args.empty() && args.back() == "expired";
    const auto mode =
        expired_only ? ReadMode::ConsiderExpiry : ReadMode::IgnoreExpiry;
    const std::size_t positional = args.size() - (expired_only ? 1 : 0);
    std::cout << (positional > 1 ? cache.clear(args[1], mode)
                                 : cache.clear(mode))
              << "\n";
  } else if (cmd == "size") {
    std::cout << cache.cache_size_bytes() << "\n";
  } else if (cmd == "vacuum") {
    if (!sqlite) {
      std::cout << "ERR vacuum needs a SQLite store\n";
      return;
    }
    sqlite->vacuum();
    std::cout << "OK\n";
  } else if (cmd == "lasterror") {
    const auto err = cache.last_error();
    std::cout << (err ? *err : std::string("(none)")) << "\n";
  } else {
    std::cout << "ERR unknown command or wrong arity, try help\n";
  }
}
} // namespace

int main(int argc, char **argv) {
  CacheSettings settings;
  std::string config_path;
  std::string store_name;
  std::string log_level = "warn";

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--store" && i + 1 < argc)
      store_name = argv[++i];
    else if (a == "--file" && i + 1 < argc)
      settings.cache_file = argv[++i];
    else if (a == "--log-level" && i + 1 < argc)
      log_level = argv[++i];
  }
  spdlog::set_level(spdlog::level::from_str(log_level));

  if (!config_path.empty()) {
    std::string err;
    if (!load_settings(config_path, settings, &err)) {
      std::cerr << "failed to load " << config_path << ": " << err << "\n";
      return 1;
    }
  }
  if (!store_name.empty())
    settings.store = store_name;

  std::unique_ptr<Cache> cache;
  SqliteStore *sqlite = nullptr;
  try {
    auto store = make_store_by_name(settings.store, settings);
    sqlite = dynamic_cast<SqliteStore *>(store.get());
    cache = std::make_unique<Cache>(settings, std::move(store));
  } catch (const std::exception &ex) {
    std::cerr << "failed to open cache: " << ex.what() << "\n";
    return 1;
  }

  std::string line;
  while (std::getline(std::cin, line)) {
    const auto args = split(line);
    if (args.empty())
      continue;
    if (args[0] == "quit")
      break;
    try {
      run_command(*cache, sqlite, args);
    } catch (const std::exception &ex) {
      std::cout << "ERR " << ex.what() << "\n";
    }
  }
  return 0;
}
