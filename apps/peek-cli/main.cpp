/**
 * peek-cli: submit image(s) for analysis, wait for the results and print them as JSON.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/peek-cli/peek_cli [--config path] --input img.png [--input img2.jpg ...]
 */

#include <peek/app/config.hpp>
#include <peek/app/service_builder.hpp>
#include <peek/core/image_format.hpp>
#include <peek/core/insights_json.hpp>
#include <peek/core/logging.hpp>

#include <charconv>
#include <chrono>
#include <cstring>
#include <memory>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

bool read_file(const std::filesystem::path& path, std::vector<std::byte>& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::vector<char> raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  out.resize(raw.size());
  std::memcpy(out.data(), raw.data(), raw.size());
  return true;
}

bool parse_number(const std::string& s, std::size_t& out) {
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

void print_usage() {
  std::cout << "Usage: peek_cli [options] --input <path> [--input <path> ...]\n"
            << "  --config <path>      Service config (key=value file); default: built-in\n"
            << "  --input <path>       Image to analyze (repeatable)\n"
            << "  --timeout-ms <n>     Per-job time budget (overrides job_timeout_ms)\n"
            << "  --workers <n>        Worker threads (overrides worker_count)\n"
            << "\nEnvironment: PEEK_<KEY> overrides any config key, e.g. PEEK_S3_SECRET_ACCESS_KEY.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> inputs;
  std::string timeout_override;
  std::string workers_override;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      timeout_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }
  if (inputs.empty()) {
    print_usage();
    return 1;
  }

  peek::app::ServiceConfig cfg = peek::app::default_config();
  if (!config_path.empty()) {
    auto loaded = peek::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Config error: " << loaded.error().message << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }
  if (auto env = peek::app::apply_env_overrides(cfg); !env) {
    std::cerr << "Config error: " << env.error().message << "\n";
    return 1;
  }
  std::size_t n = 0;
  if (!timeout_override.empty()) {
    if (!parse_number(timeout_override, n)) {
      std::cerr << "Invalid --timeout-ms " << timeout_override << "\n";
      return 1;
    }
    cfg.job_timeout = std::chrono::milliseconds(n);
  }
  if (!workers_override.empty()) {
    if (!parse_number(workers_override, n)) {
      std::cerr << "Invalid --workers " << workers_override << "\n";
      return 1;
    }
    cfg.worker_count = n;
  }

  std::unique_ptr<peek::app::AnalysisService> service;
  try {
    service = peek::app::make_analysis_service(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Startup failed: " << e.what() << "\n";
    return 1;
  }
  if (auto recovered = service->recover_pending(); !recovered) {
    peek::core::logger()->warn("recovery skipped: {}", recovered.error().message);
  }

  int exit_code = 0;
  std::vector<std::string> job_ids;
  for (const auto& input : inputs) {
    const std::filesystem::path path(input);
    std::vector<std::byte> bytes;
    if (!read_file(path, bytes)) {
      std::cerr << "Failed to read image: " << input << "\n";
      exit_code = 1;
      continue;
    }
    std::string ext = path.extension().string();
    if (!ext.empty()) ext.erase(0, 1);
    const auto content_type =
        peek::core::content_type_of(peek::core::format_from_extension(ext));

    auto id = service->submit(bytes, content_type, path.filename().string());
    if (!id) {
      std::cerr << input << ": rejected (" << peek::core::to_string(id.error().code)
                << "): " << id.error().message << "\n";
      exit_code = 1;
      continue;
    }
    job_ids.push_back(std::move(*id));
  }

  service->wait_idle();

  for (const auto& id : job_ids) {
    auto record = service->get_result(id);
    if (!record) {
      std::cerr << id << ": " << record.error().message << "\n";
      exit_code = 1;
      continue;
    }
    std::cout << peek::core::record_to_json(*record).dump(2) << "\n";
    if (record->status != peek::core::JobStatus::Completed) exit_code = 1;
  }
  service->shutdown();
  return exit_code;
}
