#pragma once
#include "../bytes.hpp"
#include "../concepts.hpp" //for RandomBitEngine
#include <bit>
#include <cstdint>
#include <limits>
#include <span>
/*
  Mwp - Multiply-with-Weyl-Plus: a 64-bit MCG combined with a Weyl sequence,
  finished with a PCG output permutation.

  32-bit output uses XSH RR, 64-bit output uses RXS M XS. The two are separate
  functions of the same combined state, so next_u32() is *not* half of next_u64().
  Both advance the state by exactly one step.

  Output permutations from the PCG family by M.E. O'Neill (2014), https://www.pcg-random.org/

  Licensed under the MIT License.
*/
namespace srng {
class Mwp final{
   using u64 = std::uint64_t;
   using u32 = std::uint32_t;
   static constexpr u64 MULT = 6364136223846793005ULL;
   static constexpr u64 WEYL = 1442695040888963407ULL;
   static constexpr u64 DEFAULT_M = 0x853c49e6748fea9bULL;
   static constexpr u64 DEFAULT_W = 0xda3e39cb94b95bdbULL;
   u64 m{1}; // MCG state. Must *always* be odd, or the MCG collapses.
   u64 w{0}; // Weyl sequence

   constexpr u64 step() noexcept{
      m *= MULT;
      w += WEYL;
      return m ^ w;
   }

public:
   using result_type = u64;
   static constexpr std::size_t seed_size = 16;
   using seed_type = byte_array<seed_size>;

   constexpr Mwp() noexcept
      : Mwp(to_le_bytes(std::array<u64, 2>{DEFAULT_M, DEFAULT_W})){}

   explicit constexpr Mwp(const seed_type& seed) noexcept{
      const auto words = read_le<u64>(seed);
      m = words[0] | 1u;
      w = words[1];
   }

   constexpr u32 next_u32() noexcept{
      const u64 state = step();
      // XSH RR: xorshift high (bits), followed by a random rotate
      const u32 xsh = static_cast<u32>(((state >> 18u) ^ state) >> 27u);
      return std::rotr(xsh, static_cast<int>(state >> 59u));
   }

   constexpr u64 next_u64() noexcept{
      u64 state = step();
      // RXS M XS: random xorshift, mcg multiply, fixed xorshift
      const u64 rshift = state >> 59u;
      state ^= state >> (5u + rshift);
      state *= MULT;
      return state ^ (state >> 42u);
   }

   constexpr result_type operator()() noexcept{
      return next_u64();
   }

   constexpr void fill_bytes(std::span<std::uint8_t> dest) noexcept{
      fill_bytes_via_next<u64>(dest, [this]() noexcept{ return next_u64(); });
   }

   constexpr void discard(unsigned long long n) noexcept{
      while(n--){
         step();
      }
   }

   static constexpr result_type min() noexcept{
      return result_type{0};
   }

   static constexpr result_type max() noexcept{
      return std::numeric_limits<result_type>::max();
   }

   constexpr bool operator==(const Mwp& rhs) const noexcept = default;
};
static_assert(RandomBitEngine<Mwp>);
} // namespace srng

#if SRNG_VALIDATE_ENGINES
namespace srng::validate {
   static_assert(prng_outputs(Mwp{counting_seed<Mwp>()}) == std::array<std::uint64_t, 6>{
      0x91bd83b841ff6961ULL, 0xde5b2ce1295f0869ULL, 0x5484f2dd6409e50cULL,
      0xa72664ec044711a5ULL, 0x6af20d840a5ebb70ULL, 0x79c183663dd4f69cULL},
      "Mwp 64-bit output does not match the golden values");

   static constexpr auto MWP_U32_OUTPUTS = []{
      Mwp rng{counting_seed<Mwp>()};
      std::array<std::uint32_t, 4> out{};
      for(auto& v : out){ v = rng.next_u32(); }
      return out;
      }();
   static_assert(MWP_U32_OUTPUTS == std::array<std::uint32_t, 4>{0x40601447u, 0x3e55de45u, 0x1fb4090fu, 0x9502f110u},
      "Mwp 32-bit output does not match the golden values");
} // namespace srng::validate
#endif //SRNG_VALIDATE_ENGINES
