#pragma once
#include "../bytes.hpp"
#include "../concepts.hpp" //for RandomBitEngine
#include <bit>
#include <cstdint>
#include <limits>
#include <span>

// pcg_xsl64.hpp - PCG XSL RR 64/32 (LCG): "xorshift low (bits), random rotation"
// on a 64-bit linear congruential generator, 32-bit output.
// Same LCG and seeding as PcgXsh64; only the output permutation differs.
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
class PcgXsl64 final{
   using u64 = std::uint64_t;
   using u32 = std::uint32_t;
   static constexpr u64 DEFAULT_STATE = 0x853c49e6748fea9bULL;
   static constexpr u64 DEFAULT_STREAM = 0xda3e39cb94b95bdbULL;
   static constexpr u64 MULT = 6364136223846793005ULL;
   u64 state{0};
   u64 increment{1}; // must *always* be odd.

public:
   using result_type = u32;
   static constexpr std::size_t seed_size = 16;
   using seed_type = byte_array<seed_size>;

   constexpr PcgXsl64() noexcept
      : PcgXsl64(to_le_bytes(std::array<u64, 2>{DEFAULT_STATE, DEFAULT_STREAM})){}

   explicit constexpr PcgXsl64(const seed_type& seed) noexcept{
      const auto words = read_le<u64>(seed);
      state = words[0];
      increment = words[1] | 1u;
      state = state * MULT + increment;
   }

   constexpr u32 next_u32() noexcept{
      const u64 old = state;
      state = old * MULT + increment;

      // output function XSL RR: fold the high half onto the low half, rotate by the top 5 bits
      const u32 xsl = static_cast<u32>(old >> 32u) ^ static_cast<u32>(old);
      return std::rotr(xsl, static_cast<int>(old >> 59u));
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
         state = state * MULT + increment;
      }
   }

   static constexpr result_type min() noexcept{
      return std::numeric_limits<result_type>::min();
   }

   static constexpr result_type max() noexcept{
      return std::numeric_limits<result_type>::max();
   }

   constexpr bool operator==(const PcgXsl64& rhs) const noexcept = default;
};
static_assert(RandomBitEngine<PcgXsl64>);
} // namespace srng

#if SRNG_VALIDATE_ENGINES
namespace srng::validate {
   // golden values for seed bytes 1..16
   static_assert(prng_outputs(PcgXsl64{counting_seed<PcgXsl64>()}) == std::array<std::uint32_t, 6>{
      0xc1473500u, 0xc39a52beu, 0x7b21ce35u, 0x30202831u, 0x8929ff24u, 0x11405d36u},
      "PcgXsl64 output does not match the golden values");
} // namespace srng::validate
#endif //SRNG_VALIDATE_ENGINES
