// ReindexTests.cpp — lazy and explicit reindexing after removals

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Registry/Registry.hpp>

#include <string>

namespace
{
  using Registry = NGIN::Registry::TicketRegistry<>;

  NGIN::Registry::Value Int(std::int64_t v) { return NGIN::Registry::Value{v}; }
  NGIN::Registry::Value Str(const char *s) { return NGIN::Registry::Value{std::string{s}}; }

  // Positions of all tickets form 0..Size()-1 and every index agrees.
  void RequireConsistent(Registry &registry)
  {
    auto values = registry.Values();
    REQUIRE(values->Size() == registry.Size());
    for (NGIN::UIntSize i = 0; i < values->Size(); ++i)
    {
      const auto &t = (*values)[i];
      CHECK(t.position == i);
      auto id = registry.Lookup(t.position);
      REQUIRE(id.has_value());
      CHECK(*id == t.id);
      if (t.valueIsPosition)
        CHECK(t.value == Int(static_cast<std::int64_t>(i)));
      auto match = registry.Browse(t.value);
      REQUIRE(match.has_value());
      if (const auto *single = std::get_if<std::string>(&*match))
        CHECK(*single == t.id);
      else
      {
        const auto &ids = std::get<NGIN::Containers::Vector<std::string>>(*match);
        bool found = false;
        for (NGIN::UIntSize k = 0; k < ids.Size(); ++k)
          found = found || ids[k] == t.id;
        CHECK(found);
      }
    }
  }
} // namespace

TEST_CASE("UnregisterShiftsLaterPositions", "[registry][Reindex]")
{
  Registry registry;
  registry.Register({.id = "a"});
  registry.Register({.id = "b"});
  registry.Register({.id = "c"});
  registry.Unregister("a");

  CHECK(registry.Get("b")->position == 0);
  CHECK(registry.Get("c")->position == 1);
  CHECK(registry.Get("c")->value == Int(1));
  CHECK(*registry.Lookup(0) == "b");
  CHECK_FALSE(registry.Lookup(2).has_value());
  RequireConsistent(registry);
}

TEST_CASE("ExplicitValuesReindexLazilyOnLookup", "[registry][Reindex]")
{
  Registry registry;
  registry.Register({.id = "a", .value = Str("x")});
  registry.Register({.id = "b", .value = Str("y")});
  registry.Register({.id = "c", .value = Str("z")});
  registry.Unregister("b");

  auto id = registry.Lookup(1);
  REQUIRE(id.has_value());
  CHECK(*id == "c");
  CHECK(registry.Get("c")->position == 1);
  RequireConsistent(registry);
}

TEST_CASE("OffboardRemovesAndRenumbers", "[registry][Reindex]")
{
  Registry registry;
  registry.Onboard({{.id = "a"}, {.id = "b"}, {.id = "c"}, {.id = "d"}, {.id = "e"}});
  registry.Offboard({"b", "d", "missing"});

  CHECK(registry.Size() == 3);
  CHECK(registry.Get("a")->position == 0);
  CHECK(registry.Get("c")->position == 1);
  CHECK(registry.Get("e")->position == 2);
  CHECK(registry.Get("e")->value == Int(2));
  CHECK_FALSE(registry.Has("b"));
  RequireConsistent(registry);
}

TEST_CASE("BrowseResolvesStalePositionValues", "[registry][Reindex]")
{
  Registry registry;
  registry.Onboard({{.id = "a"}, {.id = "b"}, {.id = "c"}});
  registry.Offboard({"a"});

  auto match = registry.Browse(Int(0));
  REQUIRE(match.has_value());
  CHECK(std::get<std::string>(*match) == "b");
  CHECK_FALSE(registry.Browse(Int(2)).has_value());
}

TEST_CASE("ReindexResetsSeededPositions", "[registry][Reindex]")
{
  Registry registry;
  registry.Register({.id = "item-1", .position = 2});
  registry.Register({.id = "item-2", .position = 3});
  registry.Register({.id = "item-3", .position = 4});

  CHECK(*registry.Lookup(3) == "item-2");

  registry.Reindex();

  CHECK(registry.Get("item-1")->position == 0);
  CHECK(registry.Get("item-2")->position == 1);
  CHECK(registry.Get("item-3")->position == 2);
  CHECK_FALSE(registry.Lookup(3).has_value());

  auto match = registry.Browse(Int(2));
  REQUIRE(match.has_value());
  CHECK(std::get<std::string>(*match) == "item-3");
  RequireConsistent(registry);
}

TEST_CASE("RegisterAfterRemovalKeepsIndicesConsistent", "[registry][Reindex]")
{
  Registry registry;
  registry.Register({.id = "a", .value = Str("x")});
  registry.Register({.id = "b", .value = Str("y")});
  registry.Register({.id = "c", .value = Str("z")});
  registry.Unregister("a");
  registry.Register({.id = "d", .value = Str("w")});

  CHECK(registry.Get("b")->position == 0);
  CHECK(registry.Get("c")->position == 1);
  CHECK(registry.Get("d")->position == 2);
  RequireConsistent(registry);
}

TEST_CASE("InterleavedRemovalsKeepInvariants", "[registry][Reindex]")
{
  Registry registry;
  for (int i = 0; i < 20; ++i)
  {
    if (i % 3 == 0)
      registry.Register({.id = "t" + std::to_string(i), .value = Str("shared")});
    else
      registry.Register({.id = "t" + std::to_string(i)});
  }
  registry.Offboard({"t0", "t5", "t19"});
  registry.Unregister("t10");
  registry.Register({.id = "late"});
  registry.Unregister("t3");

  CHECK(registry.Size() == 16);
  CHECK(registry.Keys()->Size() == registry.Size());
  RequireConsistent(registry);
}

TEST_CASE("UnregisterRenumbersSeededPositionsBeforeRemoval", "[registry][Reindex]")
{
  Registry registry;
  registry.Register({.id = "a", .position = 5});
  registry.Register({.id = "b"});
  registry.Register({.id = "c"});
  registry.Unregister("b");

  CHECK(registry.Get("a")->position == 0);
  CHECK(registry.Get("a")->value == Int(0));
  CHECK(registry.Get("c")->position == 1);
  REQUIRE(registry.Lookup(0).has_value());
  CHECK(*registry.Lookup(0) == "a");
  CHECK_FALSE(registry.Lookup(5).has_value());
  RequireConsistent(registry);
}

TEST_CASE("OffboardRenumbersSeededExplicitTickets", "[registry][Reindex]")
{
  Registry registry;
  registry.Register({.id = "a", .position = 3, .value = Str("x")});
  registry.Register({.id = "b", .value = Str("y")});
  registry.Register({.id = "c", .value = Str("x")});
  registry.Offboard({"b"});

  CHECK(registry.Get("a")->position == 0);
  CHECK(registry.Get("c")->position == 1);
  auto match = registry.Browse(Str("x"));
  REQUIRE(match.has_value());
  const auto &ids = std::get<NGIN::Containers::Vector<std::string>>(*match);
  REQUIRE(ids.Size() == 2);
  CHECK(ids[0] == "a");
  CHECK(ids[1] == "c");
  RequireConsistent(registry);
}
