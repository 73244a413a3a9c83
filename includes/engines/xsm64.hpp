#pragma once
#include "../bytes.hpp"
#include "../concepts.hpp" //for RandomBitEngine
#include <bit> //std::rotl
#include <cstdint>
#include <limits>
#include <span>
/*
  Xsm64 - XSM, 64-bit version.

  Original algorithm by Chris Doty-Humphrey (public domain), from PractRand
  http://pracrand.sourceforge.net/

  Xsm32 at double width: a 128-bit LCG split over two 64-bit words, rotate 19, shifts of 32.
  Period: 2^128, State: 191 bits, Word size: 64 bits, Seed size: 192 bits

  Licensed under the MIT License.
*/
namespace srng {
class Xsm64 final{
   using u64 = std::uint64_t;
   using u32 = std::uint32_t;
   static constexpr u64 K = 0xa3ec647659359acdULL;
   u64 lcg_low{0};
   u64 lcg_high{0};
   u64 lcg_adder{1}; // odd
   u64 history{0};

public:
   using result_type = u64;
   static constexpr std::size_t seed_size = 24;
   using seed_type = byte_array<seed_size>;

   constexpr Xsm64() noexcept
      : Xsm64(to_le_bytes(std::array<u64, 3>{0x853c49e6748fea9bULL, 0xda3e39cb94b95bdbULL, 0xb5ad4eceda1ce2a9ULL})){}

   explicit constexpr Xsm64(const seed_type& seed) noexcept{
      const auto words = read_le<u64>(seed);
      lcg_low = words[0];
      lcg_high = words[1];
      lcg_adder = words[2] | 1u;
      history = 0;
      next_u64(); // mix the history before the first output
   }

   constexpr u64 next_u64() noexcept{
      history *= K;
      u64 tmp = lcg_high + std::rotl(lcg_high ^ lcg_low, 19);
      tmp *= K;

      const u64 old_lcg_low = lcg_low;
      lcg_low += lcg_adder; // advances as in Xsm32; ports that keep lcg_low fixed give a different stream
      const u64 carry = (lcg_low < lcg_adder) ? 1u : 0u;
      lcg_high += old_lcg_low + carry;

      const u64 old_history = history ^ (history >> 32);
      history = tmp ^ (tmp >> 32);
      return tmp + old_history;
   }

   constexpr u32 next_u32() noexcept{
      return static_cast<u32>(next_u64());
   }

   constexpr result_type operator()() noexcept{
      return next_u64();
   }

   constexpr void fill_bytes(std::span<std::uint8_t> dest) noexcept{
      fill_bytes_via_next<u64>(dest, [this]() noexcept{ return next_u64(); });
   }

   constexpr void discard(unsigned long long n) noexcept{
      while(n--){
         next_u64();
      }
   }

   static constexpr result_type min() noexcept{
      return result_type{0};
   }

   static constexpr result_type max() noexcept{
      return std::numeric_limits<result_type>::max();
   }

   constexpr bool operator==(const Xsm64& rhs) const noexcept = default;
};
static_assert(RandomBitEngine<Xsm64>);
} // namespace srng

#if SRNG_VALIDATE_ENGINES
namespace srng::validate {
   static_assert(prng_outputs(Xsm64{counting_seed<Xsm64>()}) == std::array<std::uint64_t, 6>{
      0xf40159237046ded0ULL, 0x9d54fa86fb5eae99ULL, 0x9173128a8beecb48ULL,
      0xc87177576fcb9fc9ULL, 0x196273b0d0092c75ULL, 0xbccc384b4752ed41ULL},
      "Xsm64 output does not match the golden values");

   static_assert(prng_outputs(Xsm64{to_le_bytes(std::array<std::uint64_t, 3>{~0ULL, 0x0123456789abcdefULL, 0x9e3779b97f4a7c15ULL})})
      == std::array<std::uint64_t, 6>{
      0x425b679a6b05b1b9ULL, 0xdda23e3872ebdc4eULL, 0x76a8d49ad6d36fffULL,
      0x60d56e3ee9010c58ULL, 0x4877948895f64c89ULL, 0x2ad82d7f85914491ULL},
      "Xsm64 does not carry from lcg_low into lcg_high");
} // namespace srng::validate
#endif //SRNG_VALIDATE_ENGINES
