#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace certum::core {
  // Shared "certum" logger writing to stderr; created on first use at level warn.
  std::shared_ptr<spdlog::logger> logger();

  void set_log_level(spdlog::level::level_enum level);
}
