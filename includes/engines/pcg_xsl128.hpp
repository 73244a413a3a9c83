#pragma once
#include "../bytes.hpp"
#include "../concepts.hpp" //for RandomBitEngine
#include "../detail.hpp"   //for u128
#include <bit>
#include <cstdint>
#include <limits>
#include <span>

// pcg_xsl128.hpp - PCG XSL RR 128/64 (MCG): "xorshift low (bits), random rotation"
// on a 128-bit multiplicative congruential generator, 64-bit output.
// There is no increment, so the state must never be zero for useful output.
//
// Based on the PCG family by M.E. O'Neill (2014)
// https://www.pcg-random.org/
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// Copyright (c) 2014 M.E. O'Neill, pcg-random.org
namespace srng {
class PcgXsl128 final{
   using u64 = std::uint64_t;
   using u32 = std::uint32_t;
   using u128 = detail::u128;
   static constexpr u128 MULT{2549297995355413924ULL, 4865540595714422341ULL};
   static constexpr u64 DEFAULT_HIGH = 0x853c49e6748fea9bULL;
   static constexpr u64 DEFAULT_LOW = 0xda3e39cb94b95bdbULL;
   u128 state{0, 1};

public:
   using result_type = u64;
   static constexpr std::size_t seed_size = 16;
   using seed_type = byte_array<seed_size>;

   constexpr PcgXsl128() noexcept
      : PcgXsl128(to_le_bytes(std::array<u64, 2>{DEFAULT_HIGH, DEFAULT_LOW})){}

   // seed word 0 is the high half of the state, seed word 1 the low half.
   explicit constexpr PcgXsl128(const seed_type& seed) noexcept{
      const auto words = read_le<u64>(seed);
      state = detail::mul128(u128{words[0], words[1]}, MULT); // prepare for the first round
   }

   constexpr u64 next_u64() noexcept{
      const u128 old = state;
      state = detail::mul128(old, MULT);

      // output function XSL RR for 128-bit state: fold the halves, rotate by the top 6 bits (122..127)
      const u64 xsl = old.hi ^ old.lo;
      return std::rotr(xsl, static_cast<int>(old.hi >> 58u));
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
         state = detail::mul128(state, MULT);
      }
   }

   static constexpr result_type min() noexcept{
      return result_type{0};
   }

   static constexpr result_type max() noexcept{
      return std::numeric_limits<result_type>::max();
   }

   constexpr bool operator==(const PcgXsl128& rhs) const noexcept = default;
};
static_assert(RandomBitEngine<PcgXsl128>);
} // namespace srng

#if SRNG_VALIDATE_ENGINES
namespace srng::validate {
   static_assert(prng_outputs(PcgXsl128{counting_seed<PcgXsl128>()}) == std::array<std::uint64_t, 6>{
      0x005fc59731066494ULL, 0x5158046355a1dbb6ULL, 0xf2059081c038a751ULL,
      0x3cfd9694d73b847fULL, 0x44784a8b54dbd362ULL, 0x34e095ff1a43d6c4ULL},
      "PcgXsl128 output does not match the golden values");
} // namespace srng::validate
#endif //SRNG_VALIDATE_ENGINES
