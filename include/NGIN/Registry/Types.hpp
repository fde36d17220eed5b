// Types.hpp
// Ticket record, registration/patch requests and small handle types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <spdlog/fwd.h>

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace NGIN::Registry
{

  // Dense arena slot index. Only meaningful inside the registry that issued it.
  using Handle = NGIN::UInt32;

  // Default payload type. std::monostate is an explicit "null" value and still
  // counts as a supplied value.
  using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

  enum class ErrorCode : unsigned
  {
    DuplicateId = 1,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::DuplicateId};
    std::string_view message{};

    constexpr Error() = default;
    constexpr Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
  };

  enum class SeekDirection : unsigned char
  {
    First = 0,
    Last = 1,
  };

  struct RegistryOptions
  {
    // Allocate the listener table and deliver events.
    bool events{false};
    // Per-instance logger; falls back to GetLogger() when null.
    std::shared_ptr<spdlog::logger> logger{};
  };

  // Customization point: the value a ticket carries when none was supplied.
  // Specialize in namespace NGIN::Registry for payload types that are not
  // arithmetic: template<> struct PositionValue<MyValue> { static MyValue From(NGIN::UIntSize); };
  template <class V>
  struct PositionValue
  {
    static V From(NGIN::UIntSize position)
      requires std::is_arithmetic_v<V>
    {
      return static_cast<V>(position);
    }
  };

  template <>
  struct PositionValue<Value>
  {
    static Value From(NGIN::UIntSize position)
    {
      return Value{static_cast<std::int64_t>(position)};
    }
  };

  template <class V>
  concept PositionConvertible = requires(NGIN::UIntSize p) {
    { PositionValue<V>::From(p) } -> std::convertible_to<V>;
  };

  template <class V, class Id = std::string>
  struct Ticket
  {
    Id id{};
    NGIN::UIntSize position{0};
    V value{};
    bool valueIsPosition{false};

    // Identity is the id; two snapshots of the same ticket compare equal.
    friend bool operator==(const Ticket &a, const Ticket &b) { return a.id == b.id; }
  };

  // Partial ticket accepted by Register/Onboard. Unset fields are defaulted.
  template <class V, class Id = std::string>
  struct Registration
  {
    std::optional<Id> id{};
    std::optional<NGIN::UIntSize> position{};
    std::optional<V> value{};
  };

  // Update accepted by Upsert. `value` is tri-state:
  //   std::nullopt                  -> keep the current value
  //   std::optional<V>{std::nullopt} -> revert to the ticket's position
  //   a concrete V                  -> replace the value
  template <class V>
  struct Patch
  {
    std::optional<std::optional<V>> value{};

    static Patch ResetValue() { return Patch{std::optional<std::optional<V>>{std::in_place, std::nullopt}}; }
    static Patch WithValue(V v) { return Patch{std::optional<std::optional<V>>{std::in_place, std::move(v)}}; }
  };

  // Browse result: a single id, or every id sharing the value in insertion order.
  template <class Id>
  using CatalogMatch = std::variant<Id, NGIN::Containers::Vector<Id>>;

} // namespace NGIN::Registry
