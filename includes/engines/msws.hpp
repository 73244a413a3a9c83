#pragma once
#include "../bytes.hpp"
#include "../concepts.hpp" //for RandomBitEngine
#include "../seed_error.hpp"
#include <bit> //std::rotl
#include <cstdint>
#include <limits>
#include <span>
/*
  Msws - Middle Square Weyl Sequence RNG.

  Original algorithm by Bernard Widynski, "Middle Square Weyl Sequence RNG" (2017)
  https://arxiv.org/abs/1704.00358

  Period: 2^64, State: 192 bits, Word size: 64 bits, Seed size: 128 bits

  Licensed under the MIT License.
*/
namespace srng {
class Msws final{
   using u64 = std::uint64_t;
   using u32 = std::uint32_t;
   static constexpr u64 HIGH_BITS = 0xFFFF'FFFF'0000'0000ULL;
   static constexpr u64 DEFAULT_STREAM = 0xb5ad4eceda1ce2a9ULL; // Widynski's example constant
   u64 x{0};
   u64 w{0}; // Weyl sequence
   u64 s{0}; // Weyl increment, a.k.a. the stream constant. Odd, with non-zero high 32 bits.

   struct Direct{};
   constexpr Msws(u64 stream, u64 x_val, Direct) noexcept
      : x(x_val), w(0), s(stream){}

   // a stream constant with zero high bits makes w a poor Weyl sequence (and x a short cycle)
   static constexpr bool valid_stream(u64 stream) noexcept{
      return (stream & HIGH_BITS) != 0;
   }

public:
   using result_type = u64;
   static constexpr std::size_t seed_size = 16;
   using seed_type = byte_array<seed_size>;

   constexpr Msws() noexcept
      : Msws(DEFAULT_STREAM, 0, Direct{}){}

   // seed word 0 becomes the stream constant (forced odd), seed word 1 the initial x.
   // Throws seed_error if the stream constant has zero high 32 bits.
   explicit constexpr Msws(const seed_type& seed){
      const auto words = read_le<u64>(seed);
      const u64 stream = words[0] | 1u;
      if(!valid_stream(stream)){
         throw seed_error("Msws: bad seed, high 32 bits of the stream constant are zero");
      }
      s = stream;
      x = words[1];
   }

   // Seed from another generator: draw stream constants until one is acceptable,
   // then draw the initial x. Each draw is rejected with probability 2^-32, so
   // the loop is left unbounded.
   template <WordSource G>
   static constexpr Msws from_rng(G& other){
      u64 stream = 0;
      do{
         stream = other.next_u64() | 1u;
      } while(!valid_stream(stream));
      const u64 x_val = other.next_u64();
      return Msws{stream, x_val, Direct{}};
   }

   constexpr u64 next_u64() noexcept{
      x *= x;
      w += s;
      x += w;
      return std::rotl(x, 32); // x keeps the unrotated value for the next round
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

   constexpr bool operator==(const Msws& rhs) const noexcept = default;
};
static_assert(RandomBitEngine<Msws>);
} // namespace srng

#if SRNG_VALIDATE_ENGINES
namespace srng::validate {
   // seed bytes 1..16 decode to s = 0x0807060504030201 (already odd), x = 0x100f0e0d0c0b0a09
   static_assert(prng_outputs(Msws{counting_seed<Msws>()}) == std::array<std::uint64_t, 6>{
      0xb92db652c3de1059ULL, 0x26b2b64630cc2abaULL, 0xcf28a127bcfe72a5ULL,
      0xe3ae1bf513094b69ULL, 0x9628a27e110fd711ULL, 0xee95c20a815701b8ULL},
      "Msws output does not match the golden values");
} // namespace srng::validate
#endif //SRNG_VALIDATE_ENGINES
