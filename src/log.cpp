#include <spdlog/sinks/stdout_color_sinks.h>

#include <ata/log.hpp>

namespace ata {

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get("ata")) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt("ata");
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
  }();
  return instance;
}

} // namespace ata
