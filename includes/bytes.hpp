#pragma once
#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>

// bytes.hpp: little-endian conversions between words and bytes.
// Seeds arrive as byte arrays and are decoded into words with read_le().
// Engine output leaves as bytes through fill_bytes_via_next(), which every engine's fill_bytes() uses.
namespace srng {
	template <std::size_t N>
	using byte_array = std::array<std::uint8_t, N>;

	// decode a byte array into N / sizeof(Word) little-endian words
	template <std::unsigned_integral Word, std::size_t N>
	[[nodiscard]] constexpr std::array<Word, N / sizeof(Word)> read_le(const byte_array<N>& bytes) noexcept{
		static_assert(N % sizeof(Word) == 0, "byte count must be a whole number of words");
		std::array<Word, N / sizeof(Word)> words{};
		for(std::size_t i = 0; i < words.size(); ++i){
			Word w{0};
			for(std::size_t b = 0; b < sizeof(Word); ++b){
				w |= static_cast<Word>(bytes[i * sizeof(Word) + b]) << (8u * b);
			}
			words[i] = w;
		}
		return words;
	}

	// the inverse of read_le(). Handy for building seeds from known words.
	template <std::unsigned_integral Word, std::size_t N>
	[[nodiscard]] constexpr byte_array<N * sizeof(Word)> to_le_bytes(const std::array<Word, N>& words) noexcept{
		byte_array<N * sizeof(Word)> bytes{};
		for(std::size_t i = 0; i < N; ++i){
			for(std::size_t b = 0; b < sizeof(Word); ++b){
				bytes[i * sizeof(Word) + b] = static_cast<std::uint8_t>(words[i] >> (8u * b));
			}
		}
		return bytes;
	}

	// Fill dest with successive words from next_word(), least significant byte first.
	// If dest.size() is not a multiple of sizeof(Word), only the leading bytes of the
	// final word are written and the remainder of that word is thrown away.
	template <std::unsigned_integral Word, typename NextWord>
		requires std::same_as<std::invoke_result_t<NextWord&>, Word>
	constexpr void fill_bytes_via_next(std::span<std::uint8_t> dest, NextWord&& next_word) noexcept(noexcept(next_word())){
		while(!dest.empty()){
			const Word word = next_word();
			const std::size_t n = std::min(sizeof(Word), dest.size());
			for(std::size_t b = 0; b < n; ++b){
				dest[b] = static_cast<std::uint8_t>(word >> (8u * b));
			}
			dest = dest.subspan(n);
		}
	}

	// Build a 64-bit output from two 32-bit outputs, low word first.
	template <typename G>
	[[nodiscard]] constexpr std::uint64_t next_u64_via_u32(G& g) noexcept{
		const std::uint64_t lo = g.next_u32(); //sequenced: lo must be drawn before hi
		const std::uint64_t hi = g.next_u32();
		return (hi << 32) | lo;
	}
} // namespace srng
