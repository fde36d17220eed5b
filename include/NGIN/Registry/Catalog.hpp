// Catalog.hpp
// Value -> handle(s) reverse index and the memo slots for derived views
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <memory>
#include <utility>
#include <variant>

#include <NGIN/Registry/Types.hpp>

namespace NGIN::Registry::detail
{

  /**
   * Reverse index from value to the handles carrying it. A bucket holds a
   * single handle until a second handle shares the value, then an
   * insertion-ordered list. Empty buckets are removed.
   */
  template <class V>
  class ValueCatalog
  {
  public:
    using HandleList = NGIN::Containers::Vector<Handle>;
    using Bucket = std::variant<Handle, HandleList>;

    void Assign(const V &value, Handle handle)
    {
      auto *bucket = m_buckets.GetPtr(value);
      if (!bucket)
      {
        m_buckets.Insert(value, Bucket{handle});
        return;
      }
      if (auto *single = std::get_if<Handle>(bucket))
      {
        if (*single == handle)
          return;
        HandleList list;
        list.Reserve(2);
        list.PushBack(*single);
        list.PushBack(handle);
        *bucket = Bucket{std::move(list)};
        return;
      }
      auto &list = std::get<HandleList>(*bucket);
      for (NGIN::UIntSize i = 0; i < list.Size(); ++i)
      {
        if (list[i] == handle)
          return;
      }
      list.PushBack(handle);
    }

    void Unassign(const V &value, Handle handle)
    {
      auto *bucket = m_buckets.GetPtr(value);
      if (!bucket)
        return;
      if (auto *single = std::get_if<Handle>(bucket))
      {
        if (*single == handle)
          (void)m_buckets.Remove(value);
        return;
      }
      const auto &list = std::get<HandleList>(*bucket);
      HandleList next;
      next.Reserve(list.Size());
      for (NGIN::UIntSize i = 0; i < list.Size(); ++i)
      {
        if (list[i] != handle)
          next.PushBack(list[i]);
      }
      if (next.Size() == 0)
        (void)m_buckets.Remove(value);
      else if (next.Size() == 1)
        *bucket = Bucket{next[0]};
      else
        *bucket = Bucket{std::move(next)};
    }

    [[nodiscard]] const Bucket *Find(const V &value) const { return m_buckets.GetPtr(value); }

    [[nodiscard]] NGIN::UIntSize Size() const { return m_buckets.Size(); }

    void Clear() { m_buckets = {}; }

  private:
    NGIN::Containers::FlatHashMap<V, Bucket> m_buckets;
  };

  // Memoized snapshots handed out by Keys()/Values()/Entries(). A null slot
  // must be rebuilt; a set slot is returned as the same instance.
  template <class V, class Id>
  struct ViewCache
  {
    std::shared_ptr<const NGIN::Containers::Vector<Id>> keys{};
    std::shared_ptr<const NGIN::Containers::Vector<Ticket<V, Id>>> values{};
    std::shared_ptr<const NGIN::Containers::Vector<std::pair<Id, Ticket<V, Id>>>> entries{};

    void Invalidate() noexcept
    {
      keys.reset();
      InvalidateTickets();
    }

    // Drop the views that carry positions and values.
    void InvalidateTickets() noexcept
    {
      values.reset();
      entries.reset();
    }
  };

} // namespace NGIN::Registry::detail
