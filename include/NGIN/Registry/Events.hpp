// Events.hpp
// Structural event kinds and the opt-in listener table used by TicketRegistry
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Utilities/Any.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <NGIN/Registry/Export.hpp>
#include <NGIN/Registry/Types.hpp>

namespace NGIN::Registry
{

  using Any = NGIN::Utilities::Any<>;
  using ListenerId = NGIN::UInt64;
  inline constexpr ListenerId InvalidListenerId = 0;

  enum class RegistryEvent : unsigned char
  {
    Registered = 0,
    Unregistered = 1,
    Updated = 2,
    Cleared = 3,
    Reindexed = 4,
    // Application-defined event, addressed by name.
    Custom = 5,
  };

  // Canonical channel name of a structural event ("register:ticket", ...).
  // Returns an empty view for RegistryEvent::Custom.
  [[nodiscard]] NGIN_REGISTRY_API std::string_view EventName(RegistryEvent kind) noexcept;

  // Maps a channel name back to its structural kind, or Custom.
  [[nodiscard]] NGIN_REGISTRY_API RegistryEvent EventKindFromName(std::string_view name) noexcept;

  template <class V, class Id = std::string>
  struct Event
  {
    RegistryEvent kind{RegistryEvent::Custom};
    std::string name{};
    // Snapshot of the affected ticket for Registered/Unregistered/Updated.
    std::optional<Ticket<V, Id>> ticket{};
    // Payload of custom events.
    Any payload{};
  };

  namespace detail
  {
    /**
     * Name-keyed listener table with a delivery queue. Delivery is synchronous
     * and in subscription order; listener exceptions propagate to the caller.
     */
    template <class V, class Id>
    class EventChannel
    {
    public:
      using EventType = Event<V, Id>;
      using Listener = std::function<void(const EventType &)>;

      ListenerId Subscribe(std::string_view name, Listener listener)
      {
        const ListenerId id = m_nextId++;
        m_listeners[std::string{name}].PushBack(Subscription{id, std::move(listener)});
        return id;
      }

      bool Unsubscribe(std::string_view name, ListenerId id)
      {
        auto it = m_listeners.find(std::string{name});
        if (it == m_listeners.end())
          return false;
        auto &subs = it->second;
        NGIN::Containers::Vector<Subscription> kept;
        kept.Reserve(subs.Size());
        bool removed = false;
        for (NGIN::UIntSize i = 0; i < subs.Size(); ++i)
        {
          if (!removed && subs[i].id == id)
          {
            removed = true;
            continue;
          }
          kept.PushBack(std::move(subs[i]));
        }
        if (kept.Size() == 0)
          m_listeners.erase(it);
        else
          subs = std::move(kept);
        return removed;
      }

      // Deliver to the listeners subscribed at the time of the call.
      void Publish(const EventType &event) const
      {
        auto it = m_listeners.find(event.name);
        if (it == m_listeners.end())
          return;
        const auto subscribers = it->second;
        for (NGIN::UIntSize i = 0; i < subscribers.Size(); ++i)
          subscribers[i].fn(event);
      }

      void Enqueue(EventType event) { m_queue.PushBack(std::move(event)); }

      void Flush()
      {
        auto pending = std::move(m_queue);
        m_queue = {};
        for (NGIN::UIntSize i = 0; i < pending.Size(); ++i)
          Publish(pending[i]);
      }

      void DropQueued() { m_queue = {}; }

      void ClearListeners() { m_listeners.clear(); }

    private:
      struct Subscription
      {
        ListenerId id{InvalidListenerId};
        Listener fn{};
      };

      std::unordered_map<std::string, NGIN::Containers::Vector<Subscription>> m_listeners;
      NGIN::Containers::Vector<EventType> m_queue;
      ListenerId m_nextId{1};
    };
  } // namespace detail

} // namespace NGIN::Registry
