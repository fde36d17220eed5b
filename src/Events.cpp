#include <NGIN/Registry/Events.hpp>

namespace NGIN::Registry
{

  namespace
  {
    constexpr std::string_view kRegistered = "register:ticket";
    constexpr std::string_view kUnregistered = "unregister:ticket";
    constexpr std::string_view kUpdated = "update:ticket";
    constexpr std::string_view kCleared = "clear:registry";
    constexpr std::string_view kReindexed = "reindex:registry";
  } // namespace

  std::string_view EventName(RegistryEvent kind) noexcept
  {
    switch (kind)
    {
    case RegistryEvent::Registered:
      return kRegistered;
    case RegistryEvent::Unregistered:
      return kUnregistered;
    case RegistryEvent::Updated:
      return kUpdated;
    case RegistryEvent::Cleared:
      return kCleared;
    case RegistryEvent::Reindexed:
      return kReindexed;
    case RegistryEvent::Custom:
      break;
    }
    return {};
  }

  RegistryEvent EventKindFromName(std::string_view name) noexcept
  {
    if (name == kRegistered)
      return RegistryEvent::Registered;
    if (name == kUnregistered)
      return RegistryEvent::Unregistered;
    if (name == kUpdated)
      return RegistryEvent::Updated;
    if (name == kCleared)
      return RegistryEvent::Cleared;
    if (name == kReindexed)
      return RegistryEvent::Reindexed;
    return RegistryEvent::Custom;
  }

} // namespace NGIN::Registry
