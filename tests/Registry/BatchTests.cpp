// BatchTests.cpp — deferred invalidation and event delivery

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Registry/Registry.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace
{
  using Registry = NGIN::Registry::TicketRegistry<>;
  using Event = NGIN::Registry::Event<NGIN::Registry::Value>;
  using NGIN::Registry::RegistryEvent;

  Registry MakeRegistry()
  {
    NGIN::Registry::RegistryOptions options{};
    options.events = true;
    return Registry{options};
  }
} // namespace

TEST_CASE("BatchReturnsCallableResult", "[registry][Batch]")
{
  Registry registry;
  int result = registry.Batch([&]
                              {
                                registry.Register({.id = "a"});
                                return 42; });
  CHECK(result == 42);
  CHECK(registry.Size() == 1);
  CHECK_FALSE(registry.IsBatching());
}

TEST_CASE("BatchDefersViewInvalidation", "[registry][Batch]")
{
  Registry registry;
  registry.Register({.id = "a"});
  auto before = registry.Keys();

  registry.Batch([&]
                 {
                   registry.Register({.id = "b"});
                   CHECK(registry.IsBatching());
                   CHECK(registry.Keys().get() == before.get());
                   CHECK(registry.Size() == 2); });

  auto after = registry.Keys();
  CHECK(after.get() != before.get());
  CHECK(after->Size() == 2);
}

TEST_CASE("BatchQueuesEventsUntilClose", "[registry][Batch]")
{
  auto registry = MakeRegistry();
  std::vector<std::string> seen;
  registry.On(RegistryEvent::Registered, [&](const Event &e) { seen.push_back(e.ticket->id); });
  registry.On(RegistryEvent::Unregistered, [&](const Event &e) { seen.push_back("-" + e.ticket->id); });

  registry.Batch([&]
                 {
                   registry.Register({.id = "a"});
                   registry.Register({.id = "b"});
                   registry.Unregister("a");
                   CHECK(seen.empty()); });

  REQUIRE(seen.size() == 3);
  CHECK(seen[0] == "a");
  CHECK(seen[1] == "b");
  CHECK(seen[2] == "-a");
}

TEST_CASE("BatchResolvesPositionsOnClose", "[registry][Batch]")
{
  Registry registry;
  registry.Batch([&]
                 {
                   registry.Register({.id = "a"});
                   registry.Register({.id = "b"});
                   registry.Register({.id = "c"});
                   registry.Unregister("a"); });

  auto values = registry.Values();
  REQUIRE(values->Size() == 2);
  CHECK((*values)[0].id == "b");
  CHECK((*values)[0].position == 0);
  CHECK((*values)[1].position == 1);
}

TEST_CASE("NestedBatchRunsInline", "[registry][Batch]")
{
  auto registry = MakeRegistry();
  int events = 0;
  registry.On(RegistryEvent::Registered, [&](const Event &) { ++events; });

  registry.Batch([&]
                 {
                   registry.Register({.id = "a"});
                   registry.Batch([&]
                                  {
                                    registry.Register({.id = "b"});
                                    CHECK(registry.IsBatching()); });
                   CHECK(registry.IsBatching());
                   CHECK(events == 0); });

  CHECK(events == 2);
  CHECK(registry.Size() == 2);
}

TEST_CASE("ThrowingBatchDropsQueuedEvents", "[registry][Batch]")
{
  auto registry = MakeRegistry();
  int events = 0;
  registry.On(RegistryEvent::Registered, [&](const Event &) { ++events; });

  CHECK_THROWS_AS(registry.Batch([&]
                                 {
                                   registry.Register({.id = "a"});
                                   throw std::runtime_error("boom"); }),
                  std::runtime_error);

  CHECK_FALSE(registry.IsBatching());
  CHECK(events == 0);
  CHECK(registry.Has("a"));
  CHECK(registry.Keys()->Size() == 1);

  registry.Register({.id = "b"});
  CHECK(events == 1);
}

TEST_CASE("OnboardEmitsOncePerNewTicket", "[registry][Batch]")
{
  auto registry = MakeRegistry();
  std::vector<std::string> seen;
  registry.On(RegistryEvent::Registered, [&](const Event &e) { seen.push_back(e.ticket->id); });

  auto tickets = registry.Onboard({{.id = "x"}, {.id = "y"}});
  REQUIRE(tickets.Size() == 2);
  CHECK(tickets[0].id == "x");
  CHECK(tickets[1].position == 1);
  REQUIRE(seen.size() == 2);
  CHECK(seen[0] == "x");
  CHECK(seen[1] == "y");
}

TEST_CASE("OffboardEmitsOncePerRemovedTicket", "[registry][Batch]")
{
  auto registry = MakeRegistry();
  registry.Onboard({{.id = "a"}, {.id = "b"}, {.id = "c"}});
  int removed = 0;
  registry.On(RegistryEvent::Unregistered, [&](const Event &) { ++removed; });

  registry.Offboard({"a", "zzz", "c"});
  CHECK(removed == 2);
  CHECK(registry.Size() == 1);
  CHECK(registry.Get("b")->position == 0);
}
