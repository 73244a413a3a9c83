#pragma once
// detail.hpp: private helpers for 128-bit wraparound arithmetic, needed by PcgXsl128.
// Uses the compiler's __uint128_t where available and a fully constexpr two-limb fallback
// everywhere else (e.g. MSVC, where _umul128 is not constexpr).
#include <cstdint>
#ifndef SRNG_ENABLE_SELFTESTS
#define SRNG_ENABLE_SELFTESTS 0 // define to enable compile-time self-tests for the 128-bit helpers.
#endif

namespace srng {
	namespace detail {
		struct u128_parts final{
			std::uint64_t lo;
			std::uint64_t hi;
		};

		// full 64x64 -> 128 bit product, computed on 32-bit limbs.
		[[nodiscard]] constexpr u128_parts mul64_to_128_parts(std::uint64_t a, std::uint64_t b) noexcept{
			// split 32-bit limbs
			const std::uint64_t a0 = static_cast<std::uint32_t>(a);
			const std::uint64_t a1 = a >> 32;
			const std::uint64_t b0 = static_cast<std::uint32_t>(b);
			const std::uint64_t b1 = b >> 32;

			// partial products
			const std::uint64_t p00 = a0 * b0;
			const std::uint64_t p01 = a0 * b1;
			const std::uint64_t p10 = a1 * b0;
			const std::uint64_t p11 = a1 * b1;

			// combine:
			constexpr std::uint64_t lo32_mask = 0xFFFF'FFFFull;
			const std::uint64_t mid = p01 + p10;
			const std::uint64_t mid_carry = (mid < p01) ? (1ull << 32) : 0ull;
			const std::uint64_t mid_lo = (mid & lo32_mask) << 32;
			const std::uint64_t mid_hi = mid >> 32;
			const std::uint64_t lo = p00 + mid_lo;
			const std::uint64_t lo_carry = (lo < p00) ? 1ull : 0ull;

			const std::uint64_t hi = p11 + mid_hi + mid_carry + lo_carry;
			return {lo, hi};
		}

		// An unsigned 128-bit value as two 64-bit limbs. All arithmetic wraps modulo 2^128.
		struct u128 final{
			std::uint64_t hi;
			std::uint64_t lo;

			constexpr bool operator==(const u128& rhs) const noexcept = default;
		};

		// low 128 bits of a * b, using only 64-bit arithmetic.
		// The hi*hi term lands entirely above bit 127 and is dropped; the cross terms
		// only contribute their low 64 bits.
		[[nodiscard]] constexpr u128 mul128_portable(u128 a, u128 b) noexcept{
			const auto p = mul64_to_128_parts(a.lo, b.lo);
			return {p.hi + a.hi * b.lo + a.lo * b.hi, p.lo};
		}

		[[nodiscard]] constexpr u128 mul128(u128 a, u128 b) noexcept{
#if defined(__SIZEOF_INT128__)
			const __uint128_t x = (static_cast<__uint128_t>(a.hi) << 64) | a.lo;
			const __uint128_t y = (static_cast<__uint128_t>(b.hi) << 64) | b.lo;
			const __uint128_t p = x * y;
			return {static_cast<std::uint64_t>(p >> 64), static_cast<std::uint64_t>(p)};
#else
			return mul128_portable(a, b);
#endif
		}
	} //detail namespace

#if SRNG_ENABLE_SELFTESTS
	namespace detail::selftest {
		// 1. Verify 64x64 multiply
		constexpr bool check_mul(std::uint64_t a, std::uint64_t b, std::uint64_t expect_lo, std::uint64_t expect_hi){
			const auto p = mul64_to_128_parts(a, b);
			return p.lo == expect_lo && p.hi == expect_hi;
		}

		// Identity & Zero
		static_assert(check_mul(0, 0, 0, 0));
		static_assert(check_mul(UINT64_MAX, 1, UINT64_MAX, 0));

		// Boundary: 2^32 * 2^32 = 2^64 (Result: Lo=0, Hi=1)
		static_assert(check_mul(1ULL << 32, 1ULL << 32, 0, 1));

		// Max * Max = (2^64 - 1)^2 = 2^128 - 2^65 + 1
		static_assert(check_mul(UINT64_MAX, UINT64_MAX, 1, 0xFFFFFFFFFFFFFFFEull));

		// Middle carry: (2^64 - 1) * 2^32 = 2^96 - 2^32
		static_assert(check_mul(UINT64_MAX, 1ULL << 32, 0xFFFFFFFF00000000ull, 0x00000000FFFFFFFFull));

		// 2. Verify 128x128 wraparound multiply
		constexpr u128 ONE{0, 1};
		constexpr u128 ALL_ONES{UINT64_MAX, UINT64_MAX}; // == -1 mod 2^128
		static_assert(mul128_portable(ALL_ONES, ALL_ONES) == ONE);
		static_assert(mul128_portable(u128{1, 0}, u128{0, 2}) == u128{2, 0});
		static_assert(mul128_portable(u128{0, UINT64_MAX}, u128{0, UINT64_MAX}) == u128{0xFFFFFFFFFFFFFFFEull, 1});
		static_assert(mul128_portable(u128{1, 0}, u128{1, 0}) == u128{0, 0}); // 2^128 wraps to zero
		static_assert(mul128(ALL_ONES, ALL_ONES) == mul128_portable(ALL_ONES, ALL_ONES));
	} // namespace detail::selftest
#endif
} // namespace srng
