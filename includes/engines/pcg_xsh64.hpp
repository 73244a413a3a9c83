#pragma once
#include "../bytes.hpp"
#include "../concepts.hpp" //for RandomBitEngine
#include <bit>
#include <cstdint>
#include <limits>
#include <span>

// pcg_xsh64.hpp - PCG XSH RR 64/32 (LCG): "xorshift high (bits), random rotation"
// on a 64-bit linear congruential generator, 32-bit output.
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
class PcgXsh64 final{
   using u64 = std::uint64_t;
   using u32 = std::uint32_t; //Important! We must guarantee exactly 32 bits.
   static constexpr u64 DEFAULT_STATE = 0x853c49e6748fea9bULL;
   static constexpr u64 DEFAULT_STREAM = 0xda3e39cb94b95bdbULL;
   static constexpr u64 MULT = 6364136223846793005ULL;
   u64 state{0};
   u64 increment{1}; // selects the stream. Must *always* be odd.

public:
   using result_type = u32;
   static constexpr std::size_t seed_size = 16;
   using seed_type = byte_array<seed_size>;

   constexpr PcgXsh64() noexcept
      : PcgXsh64(to_le_bytes(std::array<u64, 2>{DEFAULT_STATE, DEFAULT_STREAM})){}

   // seed word 0 is the initial state, seed word 1 the increment (forced odd).
   explicit constexpr PcgXsh64(const seed_type& seed) noexcept{
      const auto words = read_le<u64>(seed);
      state = words[0];
      increment = words[1] | 1u;
      state = state * MULT + increment; // prepare for the first round
   }

   constexpr u32 next_u32() noexcept{
      const u64 old = state;
      state = old * MULT + increment;

      // output function XSH RR, for 64-bit state and 32-bit output:
      // shift by (32 + 5) / 2 = 18, drop the 64 - 32 - 5 = 27 spare bits, rotate by the top 5 bits
      const u32 xorshifted = static_cast<u32>(((old >> 18u) ^ old) >> 27u);
      const int rot = static_cast<int>(old >> 59u);
      return std::rotr(xorshifted, rot);
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

   constexpr bool operator==(const PcgXsh64& rhs) const noexcept = default;
};
static_assert(RandomBitEngine<PcgXsh64>);
} // namespace srng

#if SRNG_VALIDATE_ENGINES
// Reference: pcg32_random_r from "Really minimal PCG32 code" by M.E. O'Neill
// https://github.com/imneme/pcg-c-basic/
// adjusted for constexpr evaluation, but otherwise unchanged
namespace srng::validate {
   struct pcg_state_setseq_64{
      std::uint64_t state;
      std::uint64_t inc;
   };
   constexpr std::uint32_t pcg32_random_r(pcg_state_setseq_64* rng) noexcept{
      std::uint64_t oldstate = rng->state;
      rng->state = oldstate * 6364136223846793005ULL + rng->inc;
      std::uint32_t xorshifted = static_cast<std::uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
      std::uint32_t rot = static_cast<std::uint32_t>(oldstate >> 59u);
      return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
   }

   static constexpr auto PCG_XSH64_REFERENCE = []{
      // seed bytes 1..16: state word 0x0807060504030201, increment 0x100f0e0d0c0b0a09 (already odd)
      constexpr std::uint64_t inc = 0x100f0e0d0c0b0a09ULL;
      pcg_state_setseq_64 rng{0x0807060504030201ULL * 6364136223846793005ULL + inc, inc};
      std::array<std::uint32_t, 6> out{};
      for(auto& v : out){ v = pcg32_random_r(&rng); }
      return out;
      }();

   static_assert(prng_outputs(PcgXsh64{counting_seed<PcgXsh64>()}) == PCG_XSH64_REFERENCE, "PcgXsh64 output does not match pcg32_random_r");
   static_assert(PCG_XSH64_REFERENCE[0] == 0x4f1f04a0u);
   // state 0, increment 1: seeding leaves state = 1, whose XSH RR output is 0
   static_assert(PcgXsh64{to_le_bytes(std::array<std::uint64_t, 2>{0, 1})}.next_u32() == 0u);
} // namespace srng::validate
#endif //SRNG_VALIDATE_ENGINES
