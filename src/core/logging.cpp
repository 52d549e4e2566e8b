#include "certum/core/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace certum::core {

  std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
      if (auto existing = spdlog::get("certum")) return existing;
      auto created = spdlog::stderr_color_mt("certum");
      created->set_level(spdlog::level::warn);
      created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      return created;
    }();
    return instance;
  }

  void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
  }
}
