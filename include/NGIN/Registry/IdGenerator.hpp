// IdGenerator.hpp
// Customization point producing fresh ticket ids
#pragma once

#include <NGIN/Primitives.hpp>

#include <concepts>
#include <string>

#include <NGIN/Registry/Export.hpp>

namespace NGIN::Registry
{

  namespace detail
  {
    inline constexpr NGIN::UIntSize GeneratedIdLength = 7;

    // Random base-36 string of GeneratedIdLength characters.
    NGIN_REGISTRY_API std::string GenerateTicketId();
  } // namespace detail

  // Specialize for custom id types: static Id Next(NGIN::UInt64 serial);
  // `serial` increases on every call made by a registry instance. The registry
  // retries until the result is not already registered.
  template <class Id>
  struct IdGenerator;

  template <>
  struct IdGenerator<std::string>
  {
    static std::string Next(NGIN::UInt64) { return detail::GenerateTicketId(); }
  };

  template <std::integral I>
  struct IdGenerator<I>
  {
    static I Next(NGIN::UInt64 serial) { return static_cast<I>(serial); }
  };

  template <class Id>
  concept GeneratableId = requires(NGIN::UInt64 serial) {
    { IdGenerator<Id>::Next(serial) } -> std::convertible_to<Id>;
  };

} // namespace NGIN::Registry
