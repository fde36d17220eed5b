// Logging.hpp
// Shared diagnostics logger for registry warnings
#pragma once

#include <NGIN/Registry/Export.hpp>

#include <spdlog/fwd.h>

#include <memory>
#include <string_view>

namespace NGIN::Registry
{

  inline constexpr std::string_view LoggerName = "NGIN.Registry";

  /**
   * Logger used by registries constructed without RegistryOptions::logger.
   * Created on first use with a colour stdout sink.
   */
  NGIN_REGISTRY_API std::shared_ptr<spdlog::logger> GetLogger();

  /** Replace the shared logger. Passing null restores the default one. */
  NGIN_REGISTRY_API void SetLogger(std::shared_ptr<spdlog::logger> logger);

} // namespace NGIN::Registry
