// TicketRegistry.hpp
// Indexed registry of tickets: id store, position index, value catalog,
// cached views, lazy reindexing, batching and opt-in events
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <expected>
#if defined(SPDLOG_USE_STD_FORMAT)
#include <format>
#endif
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <NGIN/Registry/Catalog.hpp>
#include <NGIN/Registry/Events.hpp>
#include <NGIN/Registry/IdGenerator.hpp>
#include <NGIN/Registry/Logging.hpp>
#include <NGIN/Registry/Types.hpp>

namespace NGIN::Registry
{

  /**
   * Ordered collection of uniquely identified tickets.
   *
   * Every mutation updates the id store, the position index and the value
   * catalog, then invalidates the cached views and emits an event. Removals
   * leave positions stale; the next read that depends on them runs one
   * reindex pass from the lowest removed position. Batches defer cache
   * invalidation and event delivery until the batch body returns.
   *
   * Not thread-safe. Listeners run synchronously after the triggering
   * operation has finished its bookkeeping and may call back into the registry.
   * A throwing listener propagates to the caller of that operation.
   */
  template <class V = Value, class Id = std::string>
    requires PositionConvertible<V> && GeneratableId<Id>
  class TicketRegistry
  {
  public:
    using TicketType = Ticket<V, Id>;
    using RegistrationType = Registration<V, Id>;
    using PatchType = Patch<V>;
    using EventType = Event<V, Id>;
    using Listener = typename detail::EventChannel<V, Id>::Listener;
    using Predicate = std::function<bool(const TicketType &)>;
    using KeyList = NGIN::Containers::Vector<Id>;
    using TicketList = NGIN::Containers::Vector<TicketType>;
    using EntryList = NGIN::Containers::Vector<std::pair<Id, TicketType>>;

    explicit TicketRegistry(RegistryOptions options = {})
        : m_logger(options.logger ? std::move(options.logger) : GetLogger())
    {
      if (options.events)
        m_channel = std::make_unique<detail::EventChannel<V, Id>>();
    }

    TicketRegistry(TicketRegistry &&) = default;
    TicketRegistry &operator=(TicketRegistry &&) = default;

    // Store --------------------------------------------------------------

    [[nodiscard]] NGIN::UIntSize Size() const { return m_ids.Size(); }
    [[nodiscard]] bool IsEmpty() const { return Size() == 0; }
    [[nodiscard]] bool EventsEnabled() const noexcept { return m_channel != nullptr; }

    [[nodiscard]] bool Has(const Id &id) const { return m_ids.GetPtr(id) != nullptr; }

    [[nodiscard]] std::optional<TicketType> Get(const Id &id)
    {
      ResolvePendingReindex();
      if (const auto *handle = m_ids.GetPtr(id))
        return m_slots[*handle].ticket;
      return std::nullopt;
    }

    [[nodiscard]] std::optional<Id> Lookup(NGIN::UIntSize position)
    {
      ResolvePendingReindex();
      if (const auto *handle = m_positions.GetPtr(position))
        return m_slots[*handle].ticket.id;
      return std::nullopt;
    }

    [[nodiscard]] std::optional<CatalogMatch<Id>> Browse(const V &value)
    {
      // Only position-derived values can be stale in the catalog.
      if (m_positionDerived > 0)
        ResolvePendingReindex();
      const auto *bucket = m_catalog.Find(value);
      if (!bucket)
        return std::nullopt;
      if (const auto *single = std::get_if<Handle>(bucket))
        return CatalogMatch<Id>{m_slots[*single].ticket.id};
      const auto &handles = std::get<typename detail::ValueCatalog<V>::HandleList>(*bucket);
      KeyList ids;
      ids.Reserve(handles.Size());
      for (NGIN::UIntSize i = 0; i < handles.Size(); ++i)
        ids.PushBack(m_slots[handles[i]].ticket.id);
      return CatalogMatch<Id>{std::move(ids)};
    }

    // Cached views ---------------------------------------------------------

    [[nodiscard]] std::shared_ptr<const KeyList> Keys()
    {
      if (m_cache.keys)
        return m_cache.keys;
      auto keys = std::make_shared<KeyList>();
      keys->Reserve(Size());
      for (NGIN::UIntSize i = 0; i < m_slots.Size(); ++i)
      {
        if (m_slots[i].alive)
          keys->PushBack(m_slots[i].ticket.id);
      }
      m_cache.keys = keys;
      return keys;
    }

    [[nodiscard]] std::shared_ptr<const TicketList> Values()
    {
      if (m_cache.values)
        return m_cache.values;
      ResolvePendingReindex();
      auto values = std::make_shared<TicketList>();
      values->Reserve(Size());
      for (NGIN::UIntSize i = 0; i < m_slots.Size(); ++i)
      {
        if (m_slots[i].alive)
          values->PushBack(m_slots[i].ticket);
      }
      m_cache.values = values;
      return values;
    }

    [[nodiscard]] std::shared_ptr<const EntryList> Entries()
    {
      if (m_cache.entries)
        return m_cache.entries;
      ResolvePendingReindex();
      auto entries = std::make_shared<EntryList>();
      entries->Reserve(Size());
      for (NGIN::UIntSize i = 0; i < m_slots.Size(); ++i)
      {
        if (m_slots[i].alive)
          entries->PushBack(std::pair<Id, TicketType>{m_slots[i].ticket.id, m_slots[i].ticket});
      }
      m_cache.entries = entries;
      return entries;
    }

    // Mutation -------------------------------------------------------------

    /**
     * Adds a ticket. A missing id is generated, a missing position appends
     * at Size() and a missing value takes the position. Registering an id
     * that already exists logs a warning and returns the existing ticket
     * unchanged.
     */
    TicketType Register(RegistrationType registration = {})
    {
      if (registration.id)
      {
        if (const auto *handle = m_ids.GetPtr(*registration.id))
        {
          WarnDuplicate(*registration.id);
          return m_slots[*handle].ticket;
        }
      }
      return Insert(std::move(registration));
    }

    // Register without the duplicate fallback.
    [[nodiscard]] std::expected<TicketType, Error> TryRegister(RegistrationType registration)
    {
      if (registration.id && Has(*registration.id))
        return std::unexpected(Error{ErrorCode::DuplicateId, "ticket id already registered"});
      return Insert(std::move(registration));
    }

    /**
     * Creates the ticket when `id` is absent, otherwise applies `patch`.
     * Id and position never change through this call.
     */
    TicketType Upsert(const Id &id, PatchType patch = {})
    {
      const bool resetsValue = patch.value.has_value() && !patch.value->has_value();
      // Reverting to the position needs the position to be current.
      if (resetsValue)
        ResolvePendingReindex();

      const auto *found = m_ids.GetPtr(id);
      if (!found)
      {
        RegistrationType registration{};
        registration.id = id;
        if (patch.value && patch.value->has_value())
          registration.value = std::move(**patch.value);
        return Insert(std::move(registration));
      }

      const Handle handle = *found;
      auto &ticket = m_slots[handle].ticket;
      if (patch.value)
      {
        V next = resetsValue ? PositionValue<V>::From(ticket.position) : std::move(**patch.value);
        if (!(next == ticket.value))
        {
          m_catalog.Unassign(ticket.value, handle);
          m_catalog.Assign(next, handle);
          ticket.value = std::move(next);
        }
        if (ticket.valueIsPosition != resetsValue)
        {
          if (resetsValue)
            ++m_positionDerived;
          else
            --m_positionDerived;
          ticket.valueIsPosition = resetsValue;
        }
      }

      TicketType updated = ticket;
      MarkViewsStale();
      Notify(RegistryEvent::Updated, updated);
      return updated;
    }

    // Removes `id`; unknown ids are ignored.
    void Unregister(const Id &id)
    {
      const auto *found = m_ids.GetPtr(id);
      if (!found)
        return;
      TicketType removed = Remove(*found);
      if (!m_batching && m_positionDerived > 0)
        ResolvePendingReindex();
      MarkViewsStale();
      Notify(RegistryEvent::Unregistered, std::move(removed));
    }

    TicketList Onboard(std::span<const RegistrationType> registrations)
    {
      return Batch([&]
                   {
                     TicketList tickets;
                     tickets.Reserve(registrations.size());
                     for (const auto &registration : registrations)
                       tickets.PushBack(Register(registration));
                     return tickets; });
    }

    TicketList Onboard(std::initializer_list<RegistrationType> registrations)
    {
      return Onboard(std::span<const RegistrationType>{registrations.begin(), registrations.size()});
    }

    // Removes every known id in one pass. Reindexing is left to the next
    // read that needs it.
    void Offboard(std::span<const Id> ids)
    {
      TicketList removed;
      for (const auto &id : ids)
      {
        if (const auto *found = m_ids.GetPtr(id))
          removed.PushBack(Remove(*found));
      }
      if (removed.Size() == 0)
        return;
      MarkViewsStale();
      for (NGIN::UIntSize i = 0; i < removed.Size(); ++i)
        Notify(RegistryEvent::Unregistered, std::move(removed[i]));
    }

    void Offboard(std::initializer_list<Id> ids)
    {
      Offboard(std::span<const Id>{ids.begin(), ids.size()});
    }

    void Clear()
    {
      m_slots = {};
      m_ids = {};
      m_positions = {};
      m_catalog.Clear();
      m_positionDerived = 0;
      m_dirtyFrom.reset();
      m_needsReindex = false;
      MarkViewsStale();
      Notify(RegistryEvent::Cleared, std::nullopt);
    }

    // Eager full reindex: positions become 0..Size()-1 in store order.
    void Reindex()
    {
      ReindexFrom(0);
      MarkViewsStale();
      Notify(RegistryEvent::Reindexed, std::nullopt);
    }

    // Drops every listener, then clears.
    void Dispose()
    {
      if (m_channel)
      {
        m_channel->DropQueued();
        m_channel->ClearListeners();
      }
      Clear();
    }

    // Traversal ------------------------------------------------------------

    /**
     * Walks the ordered tickets from `from` (clamped into range) towards the
     * end (First) or the beginning (Last) and returns the first one accepted
     * by `predicate`, or the starting ticket when there is no predicate.
     */
    [[nodiscard]] std::optional<TicketType> Seek(SeekDirection direction = SeekDirection::First,
                                                 std::optional<std::int64_t> from = std::nullopt,
                                                 const Predicate &predicate = {})
    {
      if (IsEmpty())
        return std::nullopt;
      ResolvePendingReindex();

      const auto last = static_cast<std::int64_t>(m_slots.Size()) - 1;
      const std::int64_t start = from ? std::clamp<std::int64_t>(*from, 0, last)
                                      : (direction == SeekDirection::First ? 0 : last);
      const std::int64_t step = direction == SeekDirection::First ? 1 : -1;
      for (std::int64_t i = start; i >= 0 && i <= last; i += step)
      {
        const auto &ticket = m_slots[static_cast<NGIN::UIntSize>(i)].ticket;
        if (!predicate || predicate(ticket))
          return ticket;
      }
      return std::nullopt;
    }

    // Batching -------------------------------------------------------------

    /**
     * Runs `fn` with cache invalidation and structural events deferred, then
     * invalidates once and delivers the queued events in order. Nested calls
     * run inline. If `fn` throws, queued events are dropped and the exception
     * is rethrown.
     */
    template <class Fn>
    decltype(auto) Batch(Fn &&fn)
    {
      using Result = std::invoke_result_t<Fn>;
      if (m_batching)
        return std::forward<Fn>(fn)();

      m_batching = true;
      if constexpr (std::is_void_v<Result>)
      {
        try
        {
          std::forward<Fn>(fn)();
        }
        catch (...)
        {
          AbandonBatch();
          throw;
        }
        CloseBatch();
      }
      else
      {
        Result result = [&]() -> Result
        {
          try
          {
            return std::forward<Fn>(fn)();
          }
          catch (...)
          {
            AbandonBatch();
            throw;
          }
        }();
        CloseBatch();
        return result;
      }
    }

    [[nodiscard]] bool IsBatching() const noexcept { return m_batching; }

    // Events ---------------------------------------------------------------

    ListenerId On(std::string_view event, Listener listener)
    {
      if (!m_channel)
      {
        m_logger->warn("Events are disabled for this registry; listener for \"{}\" was not added.", event);
        return InvalidListenerId;
      }
      return m_channel->Subscribe(event, std::move(listener));
    }

    ListenerId On(RegistryEvent event, Listener listener) { return On(EventName(event), std::move(listener)); }

    void Off(std::string_view event, ListenerId listener)
    {
      if (!m_channel)
      {
        m_logger->warn("Events are disabled for this registry; listener for \"{}\" was not removed.", event);
        return;
      }
      (void)m_channel->Unsubscribe(event, listener);
    }

    void Off(RegistryEvent event, ListenerId listener) { Off(EventName(event), listener); }

    // Delivers an application-defined event immediately. No-op when events
    // are disabled.
    void Emit(std::string_view event, Any payload = {})
    {
      if (!m_channel)
        return;
      EventType e{};
      e.kind = EventKindFromName(event);
      e.name = std::string{event};
      e.payload = std::move(payload);
      m_channel->Publish(e);
    }

  private:
    struct Slot
    {
      TicketType ticket{};
      bool alive{true};
    };

    TicketType Insert(RegistrationType registration)
    {
      TicketType ticket{};
      ticket.id = registration.id ? std::move(*registration.id) : NextId();
      ticket.position = registration.position.value_or(Size());
      ticket.valueIsPosition = !registration.value.has_value();
      ticket.value = ticket.valueIsPosition ? PositionValue<V>::From(ticket.position) : std::move(*registration.value);

      const auto handle = static_cast<Handle>(m_slots.Size());
      m_slots.PushBack(Slot{ticket, true});
      m_ids.Insert(ticket.id, handle);
      AttachIndices(ticket, handle);
      if (ticket.valueIsPosition)
        ++m_positionDerived;

      MarkViewsStale();
      Notify(RegistryEvent::Registered, ticket);
      return ticket;
    }

    // Unlinks the ticket at `handle` and returns it. Leaves a dead slot and
    // lowers the dirty watermark.
    TicketType Remove(Handle handle)
    {
      auto &slot = m_slots[handle];
      DetachIndices(slot.ticket, handle);
      (void)m_ids.Remove(slot.ticket.id);
      if (slot.ticket.valueIsPosition)
        --m_positionDerived;
      slot.alive = false;

      const auto position = slot.ticket.position;
      m_dirtyFrom = m_dirtyFrom ? std::min(*m_dirtyFrom, position) : position;
      m_needsReindex = true;
      return std::move(slot.ticket);
    }

    void AttachIndices(const TicketType &ticket, Handle handle)
    {
      (void)m_positions.Remove(ticket.position);
      m_positions.Insert(ticket.position, handle);
      m_catalog.Assign(ticket.value, handle);
    }

    void DetachIndices(const TicketType &ticket, Handle handle)
    {
      // A later registration may have claimed the position already.
      if (const auto *owner = m_positions.GetPtr(ticket.position); owner && *owner == handle)
        (void)m_positions.Remove(ticket.position);
      m_catalog.Unassign(ticket.value, handle);
    }

    void ResolvePendingReindex()
    {
      if (!m_needsReindex)
        return;
      ReindexFrom(m_dirtyFrom.value_or(0));
      // Ids and their order survive a reindex, so the key list stays valid.
      if (!m_batching)
        m_cache.InvalidateTickets();
    }

    /**
     * Renumbers tickets in store order and compacts dead slots. The leading
     * run of tickets that sit before the watermark, did not move and already
     * hold their ordinal keeps its index entries. From the first ticket that
     * fails any of these on, every ticket is detached, renumbered and
     * reattached under its new handle, so catalog buckets stay in store order.
     */
    void ReindexFrom(NGIN::UIntSize watermark)
    {
      const bool compact = m_slots.Size() != Size();
      NGIN::Containers::Vector<Slot> compacted;
      if (compact)
        compacted.Reserve(Size());

      NGIN::UIntSize ordinal = 0;
      bool renumbering = false;
      for (NGIN::UIntSize read = 0; read < m_slots.Size(); ++read)
      {
        auto &slot = m_slots[read];
        if (!slot.alive)
          continue;
        const auto from = static_cast<Handle>(read);
        const auto to = static_cast<Handle>(ordinal);
        renumbering = renumbering || from != to || ordinal >= watermark || slot.ticket.position != ordinal;
        if (renumbering)
        {
          auto &ticket = slot.ticket;
          DetachIndices(ticket, from);
          ticket.position = ordinal;
          if (ticket.valueIsPosition)
            ticket.value = PositionValue<V>::From(ordinal);
          if (from != to)
          {
            (void)m_ids.Remove(ticket.id);
            m_ids.Insert(ticket.id, to);
          }
          AttachIndices(ticket, to);
        }
        if (compact)
          compacted.PushBack(std::move(slot));
        ++ordinal;
      }
      if (compact)
        m_slots = std::move(compacted);

      m_dirtyFrom.reset();
      m_needsReindex = false;
    }

    Id NextId()
    {
      Id id = IdGenerator<Id>::Next(m_nextSerial++);
      while (Has(id))
        id = IdGenerator<Id>::Next(m_nextSerial++);
      return id;
    }

    void MarkViewsStale() noexcept
    {
      if (!m_batching)
        m_cache.Invalidate();
    }

    void Notify(RegistryEvent kind, std::optional<TicketType> ticket)
    {
      if (!m_channel)
        return;
      EventType e{};
      e.kind = kind;
      e.name = std::string{EventName(kind)};
      e.ticket = std::move(ticket);
      if (m_batching)
        m_channel->Enqueue(std::move(e));
      else
        m_channel->Publish(e);
    }

    void CloseBatch()
    {
      m_batching = false;
      if (m_positionDerived > 0)
        ResolvePendingReindex();
      m_cache.Invalidate();
      if (m_channel)
        m_channel->Flush();
    }

    void AbandonBatch() noexcept
    {
      m_batching = false;
      m_cache.Invalidate();
      if (m_channel)
        m_channel->DropQueued();
    }

    void WarnDuplicate(const Id &id) const
    {
#if defined(SPDLOG_USE_STD_FORMAT)
      constexpr bool formattable = std::formattable<Id, char>;
#else
      constexpr bool formattable = fmt::is_formattable<Id>::value;
#endif
      if constexpr (formattable)
        m_logger->warn("Ticket with id \"{}\" already exists in the registry. Skipping registration.", id);
      else
        m_logger->warn("Ticket id already exists in the registry. Skipping registration.");
    }

    NGIN::Containers::Vector<Slot> m_slots;
    NGIN::Containers::FlatHashMap<Id, Handle> m_ids;
    NGIN::Containers::FlatHashMap<NGIN::UIntSize, Handle> m_positions;
    detail::ValueCatalog<V> m_catalog;
    detail::ViewCache<V, Id> m_cache;
    std::unique_ptr<detail::EventChannel<V, Id>> m_channel{};
    std::shared_ptr<spdlog::logger> m_logger{};

    NGIN::UIntSize m_positionDerived{0};
    std::optional<NGIN::UIntSize> m_dirtyFrom{};
    bool m_needsReindex{false};
    bool m_batching{false};
    NGIN::UInt64 m_nextSerial{0};
  };

} // namespace NGIN::Registry
