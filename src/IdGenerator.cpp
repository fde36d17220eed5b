#include <NGIN/Registry/IdGenerator.hpp>

#include <random>

namespace NGIN::Registry::detail
{

  namespace
  {
    constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    constexpr NGIN::UInt64 kRadix = sizeof(kAlphabet) - 1;

    std::mt19937_64 &Engine()
    {
      thread_local std::mt19937_64 engine{std::random_device{}()};
      return engine;
    }
  } // namespace

  std::string GenerateTicketId()
  {
    NGIN::UInt64 bits = Engine()();
    std::string out(GeneratedIdLength, '0');
    for (NGIN::UIntSize i = 0; i < GeneratedIdLength; ++i)
    {
      out[i] = kAlphabet[bits % kRadix];
      bits /= kRadix;
    }
    return out;
  }

} // namespace NGIN::Registry::detail
