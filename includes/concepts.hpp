#pragma once
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>      // std::uniform_random_bit_generator
#include <span>
#include <type_traits> // std::is_unsigned_v

// Concept: RandomBitEngine
//
// This concept defines the "engine contract" every generator in the library conforms to.
//
// Baseline:
// - E models std::uniform_random_bit_generator, so it plugs into <random>
//   utilities (std::shuffle, std::uniform_int_distribution, etc).
//   operator() returns the engine's native word (result_type).
// - E is default constructible (a fixed built-in seed), copyable and equality comparable.
//
// Seeding:
// - E::seed_type is a fixed-size byte array of E::seed_size bytes, decoded as little-endian words.
// - E is explicitly constructible from a seed_type. That constructor may throw srng::seed_error.
//
// Output:
// - next_u32() and next_u64() advance the state and return one word. Each engine derives
//   one width from the other (two 32-bit words, or truncation of a 64-bit word) unless
//   documented otherwise.
// - fill_bytes() writes any number of bytes, little-endian, one native word at a time.
// - discard(n) advances by n native words.
namespace srng {
	// anything that can hand out 64-bit words, e.g. to seed another engine from.
	template<typename G>
	concept WordSource = requires(G& g){
		{ g.next_u64() } -> std::same_as<std::uint64_t>;
	};

	template<typename E>
	concept RandomBitEngine =
		std::uniform_random_bit_generator<E> &&
		WordSource<E> &&
		std::default_initializable<E> &&
		std::copy_constructible<E> &&
		std::equality_comparable<E> &&
		std::is_unsigned_v<typename E::result_type> &&
		(E::min() == typename E::result_type{0}) &&
		(E::max() == std::numeric_limits<typename E::result_type>::max()) &&
		std::same_as<typename E::seed_type, std::array<std::uint8_t, E::seed_size>> &&
		std::constructible_from<E, const typename E::seed_type&> &&
		requires(E& e, std::span<std::uint8_t> dest, unsigned long long n){
			{ e.next_u32() } noexcept -> std::same_as<std::uint32_t>;
			{ e.fill_bytes(dest) } noexcept -> std::same_as<void>;
			{ e.discard(n) } noexcept -> std::same_as<void>;
	};
} // namespace srng

#ifndef SRNG_VALIDATE_ENGINES
// Define SRNG_VALIDATE_ENGINES to 0 to skip compile-time validation of engine outputs.
#define SRNG_VALIDATE_ENGINES 1
#endif

#if SRNG_VALIDATE_ENGINES
namespace srng::validate {
	template <typename Engine, typename T = typename Engine::result_type, std::size_t N = 6>
	constexpr std::array<T, N> prng_outputs(Engine&& rng){
		std::array<T, N> out{};
		for(auto& v : out) v = rng();
		return out;
	}

	// the seed used for all golden vectors: bytes 1, 2, 3, ... seed_size
	template <typename Engine>
	constexpr typename Engine::seed_type counting_seed() noexcept{
		typename Engine::seed_type seed{};
		for(std::size_t i = 0; i < seed.size(); ++i){
			seed[i] = static_cast<std::uint8_t>(i + 1);
		}
		return seed;
	}
} // namespace srng::validate
#endif // SRNG_VALIDATE_ENGINES
