#include <iostream>
#include <string>
#include <vector>
#include <NGIN/Benchmark.hpp>
#include <NGIN/Registry/Registry.hpp>

using namespace NGIN;

namespace RegistryBench
{
  using Registry = NGIN::Registry::TicketRegistry<>;
  using Reg = NGIN::Registry::Registration<NGIN::Registry::Value>;

  std::vector<Reg> MakeRegistrations(int count)
  {
    std::vector<Reg> out;
    out.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i)
    {
      Reg r{};
      r.id = "t" + std::to_string(i);
      if (i % 2 == 0)
        r.value = NGIN::Registry::Value{std::string{"even"}};
      out.push_back(std::move(r));
    }
    return out;
  }
}

int main()
{
  using RegistryBench::Registry;

  constexpr int N = 10000;
  const auto registrations = RegistryBench::MakeRegistrations(N);

  std::vector<std::string> evenIds;
  for (int i = 0; i < N; i += 2)
    evenIds.push_back("t" + std::to_string(i));

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        Registry registry;
                        ctx.start();
                        for (const auto &r : registrations)
                          (void)registry.Register(r);
                        ctx.doNotOptimize(registry.Size());
                        ctx.stop(); }, "Register 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        Registry registry;
                        ctx.start();
                        auto tickets = registry.Onboard(std::span<const RegistryBench::Reg>{registrations.data(), registrations.size()});
                        ctx.doNotOptimize(tickets.Size());
                        ctx.stop(); }, "Onboard 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        Registry registry;
                        registry.Onboard(std::span<const RegistryBench::Reg>{registrations.data(), registrations.size()});
                        ctx.start();
                        registry.Offboard(std::span<const std::string>{evenIds.data(), evenIds.size()});
                        auto last = registry.Lookup(registry.Size() - 1);
                        ctx.doNotOptimize(last);
                        ctx.stop(); }, "Offboard 5k + reindex");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        Registry registry;
                        registry.Onboard(std::span<const RegistryBench::Reg>{registrations.data(), registrations.size()});
                        ctx.start();
                        for (int i = 0; i < 100; ++i)
                          registry.Unregister("t" + std::to_string(i * 2 + 1));
                        ctx.doNotOptimize(registry.Size());
                        ctx.stop(); }, "Unregister 100 (position-derived)");

  Registry lookups;
  lookups.Onboard(std::span<const RegistryBench::Reg>{registrations.data(), registrations.size()});

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int hits = 0;
                        for (int i = 0; i < N; ++i)
                          hits += lookups.Has(registrations[static_cast<std::size_t>(i)].id.value()) ? 1 : 0;
                        ctx.doNotOptimize(hits);
                        ctx.stop(); }, "Has(id) 10k hits");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int hits = 0;
                        for (NGIN::UIntSize i = 0; i < static_cast<NGIN::UIntSize>(N); ++i)
                          hits += lookups.Lookup(i).has_value() ? 1 : 0;
                        ctx.doNotOptimize(hits);
                        ctx.stop(); }, "Lookup(position) 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        auto match = lookups.Browse(NGIN::Registry::Value{std::string{"even"}});
                        ctx.doNotOptimize(match);
                        ctx.stop(); }, "Browse shared value (5k ids)");

  auto results = NGIN::Benchmark::RunAll<Milliseconds>();
  NGIN::Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
