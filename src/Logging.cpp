#include <NGIN/Registry/Logging.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <utility>

namespace NGIN::Registry
{

  namespace
  {
    std::shared_ptr<spdlog::logger> g_logger{};

    std::shared_ptr<spdlog::logger> MakeDefaultLogger()
    {
      const std::string name{LoggerName};
      if (auto existing = spdlog::get(name))
        return existing;
      auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
      logger->set_level(spdlog::level::info);
      logger->flush_on(spdlog::level::warn);
      return logger;
    }
  } // namespace

  std::shared_ptr<spdlog::logger> GetLogger()
  {
    if (!g_logger)
      g_logger = MakeDefaultLogger();
    return g_logger;
  }

  void SetLogger(std::shared_ptr<spdlog::logger> logger)
  {
    g_logger = std::move(logger);
  }

} // namespace NGIN::Registry
