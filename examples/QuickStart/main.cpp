#include <NGIN/Registry/Registry.hpp>

#include <iostream>
#include <string>
#include <variant>

int main() {
  using namespace NGIN::Registry;
  std::cout << "Library: " << LibraryName() << "\n";

  RegistryOptions options{};
  options.events = true;
  TicketRegistry<> registry{options};

  registry.On(RegistryEvent::Registered, [](const Event<Value> &e) {
    std::cout << "registered " << e.ticket->id << " at " << e.ticket->position << "\n";
  });

  registry.Register({.id = "alpha"});
  registry.Register({.id = "beta", .value = Value{std::string{"tagged"}}});
  registry.Register({.id = "gamma", .value = Value{std::string{"tagged"}}});
  auto generated = registry.Register();
  std::cout << "generated id: " << generated.id << "\n";

  // Reverse lookup by value
  if (auto match = registry.Browse(Value{std::string{"tagged"}})) {
    if (const auto *ids = std::get_if<NGIN::Containers::Vector<std::string>>(&*match))
      std::cout << "tagged tickets: " << ids->Size() << "\n";
  }

  // Removing from the front shifts everyone after it
  registry.Unregister("alpha");
  if (auto first = registry.Lookup(0))
    std::cout << "position 0 is now " << *first << "\n";

  registry.Batch([&] {
    registry.Upsert("beta", Patch<Value>::WithValue(Value{std::int64_t{7}}));
    registry.Offboard({"gamma"});
  });

  auto entries = registry.Entries();
  for (NGIN::UIntSize i = 0; i < entries->Size(); ++i)
    std::cout << (*entries)[i].first << " -> position " << (*entries)[i].second.position << "\n";

  return 0;
}
