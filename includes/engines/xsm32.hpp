#pragma once
#include "../bytes.hpp"
#include "../concepts.hpp" //for RandomBitEngine
#include <bit> //std::rotl
#include <cstdint>
#include <limits>
#include <span>
/*
  Xsm32 - XSM, 32-bit version.

  Original algorithm by Chris Doty-Humphrey (public domain), from PractRand
  http://pracrand.sourceforge.net/

  A 64-bit LCG split over two 32-bit words (lcg_low, lcg_high) with an odd adder,
  whose output is mixed with the previous step's output ("history").
  Period: 2^64, State: 95 bits, Word size: 32 bits, Seed size: 96 bits

  Licensed under the MIT License.
*/
namespace srng {
class Xsm32 final{
   using u32 = std::uint32_t;
   using u64 = std::uint64_t;
   static constexpr u32 K = 0x6595a395u;
   u32 lcg_low{0};
   u32 lcg_high{0};
   u32 lcg_adder{1}; // odd
   u32 history{0};

public:
   using result_type = u32;
   static constexpr std::size_t seed_size = 12;
   using seed_type = byte_array<seed_size>;

   constexpr Xsm32() noexcept
      : Xsm32(to_le_bytes(std::array<u32, 3>{0x748fea9bu, 0x853c49e6u, 0x94b95bdbu})){}

   explicit constexpr Xsm32(const seed_type& seed) noexcept{
      const auto words = read_le<u32>(seed);
      lcg_low = words[0];
      lcg_high = words[1];
      lcg_adder = words[2] | 1u;
      history = 0;
      next_u32(); // mix the history before the first output
   }

   constexpr u32 next_u32() noexcept{
      u32 rv = history * K;
      u32 tmp = lcg_high + std::rotl(lcg_high ^ lcg_low, 11);
      tmp *= K;

      const u32 old_lcg_low = lcg_low;
      lcg_low += lcg_adder;
      const u32 carry = (lcg_low < lcg_adder) ? 1u : 0u;
      lcg_high += old_lcg_low + carry;

      rv ^= rv >> 16;
      history = tmp ^ (tmp >> 16);
      return rv + history;
   }

   constexpr u64 next_u64() noexcept{
      return next_u64_via_u32(*this);
   }

   constexpr result_type operator()() noexcept{
      return next_u32();
   }

   constexpr void fill_bytes(std::span<std::uint8_t> dest) noexcept{
      fill_bytes_via_next<u32>(dest, [this]() noexcept{ return next_u32(); });
   }

   constexpr void discard(unsigned long long n) noexcept{
      while(n--){
         next_u32();
      }
   }

   static constexpr result_type min() noexcept{
      return std::numeric_limits<result_type>::min();
   }

   static constexpr result_type max() noexcept{
      return std::numeric_limits<result_type>::max();
   }

   constexpr bool operator==(const Xsm32& rhs) const noexcept = default;
};
static_assert(RandomBitEngine<Xsm32>);
} // namespace srng

#if SRNG_VALIDATE_ENGINES
namespace srng::validate {
   static_assert(prng_outputs(Xsm32{counting_seed<Xsm32>()}) == std::array<std::uint32_t, 6>{
      0x96295e09u, 0x16c524a7u, 0xa8a6db5cu, 0xa10b4825u, 0xbde364dcu, 0xdb26bb47u},
      "Xsm32 output does not match the golden values");

   // lcg_low = 0xffffffff with a large adder: the low word wraps on most steps
   static_assert(prng_outputs(Xsm32{to_le_bytes(std::array<std::uint32_t, 3>{0xffffffffu, 0x12345678u, 0x9e3779b9u})})
      == std::array<std::uint32_t, 6>{
      0x544b619au, 0xeefe424cu, 0x3a20c23cu, 0x859c32c1u, 0x26593e44u, 0x2a6a8c21u},
      "Xsm32 does not carry from lcg_low into lcg_high");
} // namespace srng::validate
#endif //SRNG_VALIDATE_ENGINES
