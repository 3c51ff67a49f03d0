#include <gscoach/log.hpp>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace gscoach {

static std::shared_ptr<spdlog::logger> make_logger_() {
  if (auto existing = spdlog::get("gscoach")) return existing;
  auto l = spdlog::stderr_color_mt("gscoach");
  l->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  l->set_level(spdlog::level::info);
  return l;
}

spdlog::logger& logger() {
  static const std::shared_ptr<spdlog::logger> l = make_logger_();
  return *l;
}

void init_logging(spdlog::level::level_enum level) {
  auto& l = logger();
  l.set_level(level);
  l.flush_on(spdlog::level::warn);
}

} // namespace gscoach
