#pragma once
#include "bytes.hpp"
#include "concepts.hpp"
#include "seed_error.hpp"
#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
// Utility functions for producing engine seeds.
//
// Every engine takes a fixed-size byte array as its seed. This file provides ways to get one:
// - from_bytes<E>(): validate and copy a runtime-sized byte view (e.g. read from a file or a pipe)
// - expand<E>(): stretch a single 64-bit value into a full seed, deterministically
// - from_text(): hash a string into a 64-bit value, usable with expand<E>()
//
// All of these are deterministic. Acquiring entropy from the system is left to the caller.
namespace srng {
	// Construct E from a runtime-sized byte view. The view must hold exactly E::seed_size bytes.
	// Throws seed_error on a size mismatch, and passes on any seed_error raised by E itself.
	template <RandomBitEngine E>
	[[nodiscard]] E from_bytes(std::span<const std::uint8_t> bytes){
		if(bytes.size() != E::seed_size){
			throw seed_error("seed must be exactly " + std::to_string(E::seed_size)
				+ " bytes, got " + std::to_string(bytes.size()));
		}
		typename E::seed_type seed{};
		std::ranges::copy(bytes, seed.begin());
		return E{seed};
	}

	namespace seed {
		using u64 = std::uint64_t;

		// xNASAM mixing function by Pelle Evensen (2020).
		// https://mostlymangling.blogspot.com/2020/01/nasam-not-another-strange-acronym-mixer.html
		//
		// The extra parameter `c` acts as a domain-separation key. `c` must be non-zero.
		[[nodiscard]] constexpr u64 xnasam(u64 x, u64 c = 0x534545442D3031ULL) noexcept{
			x ^= c;
			x ^= std::rotr(x, 25) ^ std::rotr(x, 47);
			x *= 0x9E6C63D0676A9A99ULL;
			x ^= (x >> 23) ^ (x >> 51);
			x *= 0x9E6D62D06F6A9A9BULL;
			x ^= (x >> 23) ^ (x >> 51);
			return x;
		}

		// FNV1a for string hashing, finished with xnasam
		[[nodiscard]] constexpr u64 from_text(std::string_view str) noexcept{
			u64 hash = 14695981039346656037ULL;
			for(const char c : str){
				hash ^= static_cast<unsigned char>(c);
				hash *= 1099511628211ULL;
			}
			return xnasam(hash);
		}

		// Stretch one 64-bit value into a complete seed for E.
		// A golden-ratio Weyl counter is run through xnasam, one 64-bit word per 8 bytes,
		// so neighbouring values (0, 1, 2...) give unrelated seeds.
		// Note: the result is only bytes. An engine with seed preconditions (Msws) can still reject it.
		template <RandomBitEngine E>
		[[nodiscard]] constexpr typename E::seed_type expand(u64 value) noexcept{
			typename E::seed_type out{};
			u64 counter = value;
			fill_bytes_via_next<u64>(out, [&counter]() noexcept -> u64{
				counter += 0x9E3779B97F4A7C15ULL; // golden ratio increment
				return xnasam(counter);
				});
			return out;
		}
	} // namespace seed
} // namespace srng

/* Example usage:
using namespace srng;

constexpr auto key = seed::from_text("practrand-run-7");
PcgXsh64 rng1{seed::expand<PcgXsh64>(key)};         // derived at compile time
Xsm64    rng2{from_bytes<Xsm64>(bytes_from_a_file)}; // throws seed_error unless exactly 24 bytes
Msws     rng3 = Msws::from_rng(rng1);                // draws the stream constant from another engine
*/
