#pragma once

#include <string_view>

#include <NGIN/Registry/Export.hpp>
#include <NGIN/Registry/Types.hpp>
#include <NGIN/Registry/Logging.hpp>
#include <NGIN/Registry/Events.hpp>
#include <NGIN/Registry/IdGenerator.hpp>
#include <NGIN/Registry/Catalog.hpp>
#include <NGIN/Registry/TicketRegistry.hpp>

namespace NGIN::Registry
{

  // For quick sanity checks / examples.
  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Registry"; }

} // namespace NGIN::Registry
