#include "model_cache/log.hpp"
#include "model_cache/model_cache.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

void usage() {
  std::cerr
      << "usage: model_cache_cli [--dir D] [--storage memory|durable-kv|"
         "blob-cache]\n"
         "                       [--max-size BYTES] [--max-age-ms MS]\n"
         "                       [--config FILE] [--verify] [--log-level L]\n"
         "                       <command> [args]\n"
         "commands: put <id> <file> [version] | get <id> <out> | has <id> |\n"
         "          rm <id> | verify <id> | list | stats | sweep | clear\n";
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  try {
    std::size_t idx = 0;
    out = std::stoull(s, &idx);
    return idx == s.size();
  } catch (const std::exception &) {
    return false;
  }
}

bool read_file(const std::string &path, std::vector<std::uint8_t> *out) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    return false;
  out->assign(std::istreambuf_iterator<char>(in),
              std::istreambuf_iterator<char>());
  return !in.bad();
}

bool write_file(const std::string &path, const std::vector<std::uint8_t> &data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open())
    return false;
  out.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
  return static_cast<bool>(out);
}

int fail(const model_cache::CacheError &err, const std::string &what) {
  std::cerr << what;
  if (err.code != model_cache::ErrorCode::None)
    std::cerr << ": " << model_cache::error_code_name(err.code) << ": "
              << err.message;
  std::cerr << "\n";
  return 1;
}

} // namespace

int main(int argc, char **argv) {
  model_cache::CacheConfig cfg;
  cfg.data_dir = "./model_cache_data";
  std::string log_level = "warn";
  std::vector<std::string> positional;

  // Config file first so explicit flags override it.
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      std::string err;
      if (!model_cache::load_config_file(argv[i + 1], &cfg, &err)) {
        std::cerr << "config: " << err << "\n";
        return 2;
      }
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    std::uint64_t n = 0;
    if (a == "--dir" && i + 1 < argc) {
      cfg.data_dir = argv[++i];
    } else if (a == "--storage" && i + 1 < argc) {
      auto kind = model_cache::parse_storage_kind(argv[++i]);
      if (!kind) {
        usage();
        return 2;
      }
      cfg.storage = *kind;
    } else if (a == "--max-size" && i + 1 < argc) {
      if (!parse_u64(argv[++i], n) || n == 0) {
        usage();
        return 2;
      }
      cfg.max_size_bytes = static_cast<std::size_t>(n);
    } else if (a == "--max-age-ms" && i + 1 < argc) {
      if (!parse_u64(argv[++i], n) || n == 0) {
        usage();
        return 2;
      }
      cfg.max_age = std::chrono::milliseconds(n);
    } else if (a == "--config" && i + 1 < argc) {
      ++i;
    } else if (a == "--verify") {
      cfg.verify_on_retrieve = true;
    } else if (a == "--log-level" && i + 1 < argc) {
      log_level = argv[++i];
    } else if (a == "-h" || a == "--help") {
      usage();
      return 0;
    } else {
      positional.push_back(a);
    }
  }
  if (positional.empty()) {
    usage();
    return 2;
  }

  auto log = spdlog::stderr_color_mt(model_cache::kLoggerName);
  log->set_level(spdlog::level::from_str(log_level));

  model_cache::ModelCache cache(cfg);
  const std::string &cmd = positional[0];
  model_cache::CacheError err;

  if (cmd == "put" && (positional.size() == 3 || positional.size() == 4)) {
    std::vector<std::uint8_t> data;
    if (!read_file(positional[2], &data)) {
      std::cerr << "cannot read " << positional[2] << "\n";
      return 1;
    }
    const std::string version = positional.size() == 4 ? positional[3] : "1.0.0";
    if (!cache.store(positional[1], data, version, &err))
      return fail(err, "put failed");
    std::cout << "stored " << positional[1] << " (" << data.size()
              << " bytes)\n";
    return 0;
  }
  if (cmd == "get" && positional.size() == 3) {
    auto data = cache.retrieve(positional[1], &err);
    if (!data)
      return fail(err, "miss " + positional[1]);
    if (!write_file(positional[2], *data)) {
      std::cerr << "cannot write " << positional[2] << "\n";
      return 1;
    }
    std::cout << "wrote " << data->size() << " bytes to " << positional[2]
              << "\n";
    return 0;
  }
  if (cmd == "has" && positional.size() == 2) {
    const bool present = cache.has(positional[1], &err);
    std::cout << (present ? "yes" : "no") << "\n";
    return present ? 0 : 1;
  }
  if (cmd == "rm" && positional.size() == 2) {
    if (!cache.remove(positional[1], &err))
      return fail(err, "rm failed");
    return 0;
  }
  if (cmd == "verify" && positional.size() == 2) {
    if (!cache.verify(positional[1], &err))
      return fail(err, "verify failed for " + positional[1]);
    std::cout << "ok\n";
    return 0;
  }
  if (cmd == "list" && positional.size() == 1) {
    for (const auto &m : cache.list()) {
      std::cout << m.id << "\t" << m.size_bytes << "\t" << m.version << "\t"
                << model_cache::to_epoch_ms(m.created_at) << "\t"
                << model_cache::to_epoch_ms(m.last_accessed) << "\t"
                << m.checksum << "\n";
    }
    return 0;
  }
  if (cmd == "stats" && positional.size() == 1) {
    std::cout << cache.info();
    return 0;
  }
  if (cmd == "sweep" && positional.size() == 1) {
    std::cout << "expired " << cache.sweep_expired() << "\n";
    return 0;
  }
  if (cmd == "clear" && positional.size() == 1) {
    if (!cache.clear(&err))
      return fail(err, "clear failed");
    return 0;
  }
  usage();
  return 2;
}
