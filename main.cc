#include <drogon/drogon.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "config/config.hpp"
#include "controllers/buckets.hpp"
#include "services/service_manager.hpp"
#include "utilities/conversion.hpp"
#include "utilities/duration.hpp"

void print_help() {
  std::cout << "Usage: bucket-health [OPTIONS]\n\n"
               "Options:\n"
               "  --test, -t       Run in test mode using test_config.json.\n"
               "                   Searches up to 3 parent directories up.\n"
               "  --config <file>  Use specified config file.\n"
               "                   Searches up to 3 parent directories up.\n"
               "  --port <port>    Port of the fallback listener (default 8000),\n"
               "                   used when the config declares no listeners.\n"
               "  --help, -h       Display this help message and exit.\n";
}

std::string find_config_file(const std::string& filename) {
  // Search up to 3 parent directories up.
  std::vector<std::string> possible_paths = {
      filename, "../" + filename, "../../" + filename, "../../../" + filename};

  for (const auto& path : possible_paths) {
    if (std::filesystem::exists(path)) {
      std::puts(std::format("Found config file at: {}", path).c_str());
      return path;
    }
  }

  // If not found, return the original path and log a warning
  std::cerr << std::format(
      "Warning: Could not find {} in any of the expected locations.\n",
      filename);
  std::cerr << std::format("Will try with {} directly.\n", filename);
  return filename;
}

int main(int argc, char* argv[]) {
  bool test_mode = false;
  std::string config_path = "";
  std::optional<std::uint16_t> port;

  // Parse command line arguments
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--test" || arg == "-t") {
      test_mode = true;
      std::puts("Running in test mode");
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = find_config_file(argv[i + 1]);
      i++;  // Skip the next argument
      std::puts(std::format("Using config: {}", config_path).c_str());
    } else if (arg == "--port" && i + 1 < argc) {
      auto parsed = convert::string_to_number<std::uint16_t>(argv[i + 1]);
      if (!parsed || *parsed == 0) {
        std::puts(std::format("Invalid port: {}", argv[i + 1]).c_str());
        return 1;
      }
      port = *parsed;
      i++;
    } else if (arg == "--help" || arg == "-h") {
      print_help();
      return 0;
    } else {
      std::puts(std::format("Unknown option: {}", arg).c_str());
      print_help();
      return 1;
    }
  }

  // Load config file
  if (test_mode) {
    config_path = find_config_file("test_config.json");
    std::puts(
        std::format("Loading test configuration from: {}", config_path)
            .c_str());
  } else if (!config_path.empty()) {
    // Use user-specified config file
    std::puts(
        std::format("Loading configuration from: {}", config_path).c_str());
  } else {
    // Use default config file
    config_path = find_config_file("config.json");
    std::puts(
        std::format("Loading default configuration from: {}", config_path)
            .c_str());
  }
  try {
    drogon::app().loadConfigFile(config_path);
  } catch (const std::exception& e) {
    std::puts(std::format("Error loading configuration: {}", e.what()).c_str());
    return 1;
  }

  // Applied to requests that omit max_age
  std::optional<std::chrono::seconds> default_max_age;
  const std::string default_max_age_token =
      config::get_config_value("default_max_age", "24h");
  if (default_max_age_token != config::REPORT_ONLY_MAX_AGE) {
    auto parsed = utilities::parse_duration(default_max_age_token);
    if (!parsed) {
      LOG_ERROR << "Invalid default_max_age: " << parsed.error().reason;
      return 1;
    }
    default_max_age = *parsed;
  }

  ServiceManager services;
  try {
    services.initialize();
  } catch (const std::exception& e) {
    LOG_ERROR << "Error initializing service manager: " << e.what();
    return 1;
  }

  drogon::app().registerController(std::make_shared<api::BucketController>(
      services.get_inspector(), default_max_age));

  // Listeners declared in the config file win over the fallback listener
  if (config::declares_listeners(config_path)) {
    if (port) {
      LOG_WARN << "--port " << *port
               << " ignored, the config file declares its own listeners";
    }
    LOG_INFO << "Starting bucket-health on the configured listeners";
  } else {
    const std::uint16_t listen_port = port.value_or(config::DEFAULT_PORT);
    drogon::app().addListener("0.0.0.0", listen_port);
    LOG_INFO << "Starting bucket-health on 0.0.0.0:" << listen_port;
  }

  drogon::app().run();

  services.shutdown();
  return 0;
}
