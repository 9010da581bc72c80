#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include "config.hpp"
#include "editor.hpp"
#include "terminal.hpp"

/*ncurses owns the screen, so logs only go to the file named by IGUIDE_LOG*/
static void setup_logging() {
  const char* path = std::getenv(IG_LOG_ENV);
  if (!path || !*path) {
    spdlog::set_level(spdlog::level::off);
    return;
  }
  try {
    spdlog::set_default_logger(spdlog::basic_logger_mt("iguide", path));
  } catch (const spdlog::spdlog_ex& e) {
    std::fprintf(stderr, "iguide: logging disabled: %s\n", e.what());
    spdlog::set_level(spdlog::level::off);
    return;
  }
  spdlog::set_level(spdlog::level::info);
  spdlog::cfg::load_env_levels();
  spdlog::flush_on(spdlog::level::warn);
}

int main(int argc, char** argv) {
  setup_logging();
  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);
  Terminal term;
  Editor ed(path);
  ed.run();
  spdlog::shutdown();
  return 0;
}
