#include "gtest/gtest.h"
#include "smallrng.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

using namespace srng;

namespace {
    template<class Engine>
    Engine seeded(std::uint64_t value){
        return Engine{seed::expand<Engine>(value)};
    }

    std::vector<std::uint8_t> le_bytes(std::uint64_t v, std::size_t n){
        std::vector<std::uint8_t> out(n);
        for(std::size_t i = 0; i < n; ++i){
            out[i] = static_cast<std::uint8_t>(v >> (8u * i));
        }
        return out;
    }

    std::vector<std::uint8_t> to_vector(std::initializer_list<unsigned> bytes){
        std::vector<std::uint8_t> out;
        for(auto b : bytes){ out.push_back(static_cast<std::uint8_t>(b)); }
        return out;
    }

    // hands out a fixed list of words, to drive Msws::from_rng deterministically
    struct ScriptedSource{
        std::vector<std::uint64_t> words;
        std::size_t drawn = 0;

        std::uint64_t next_u64(){
            return words.at(drawn++);
        }
    };
}

template<class Engine>
class EngineTypedTest : public ::testing::Test{
protected:
    Engine rng = seeded<Engine>(123);
};

using EnginesUnderTest = ::testing::Types<
    Msws,
    PcgXsh64,
    PcgXsl64,
    PcgXsl128,
    Mwp,
    Xsm32,
    Xsm64
>;

TYPED_TEST_SUITE(EngineTypedTest, EnginesUnderTest);

// -----------------------------------------------------------------------------
// Determinism
// -----------------------------------------------------------------------------
TYPED_TEST(EngineTypedTest, DefaultConstructedEnginesAreDeterministic){
    TypeParam a{};
    TypeParam b{};
    for(int i = 0; i < 1024; ++i){
        EXPECT_EQ(a(), b()) << "Default constructed engines must produce the same sequence";
    }
}

TYPED_TEST(EngineTypedTest, SameSeedProducesSameSequenceForAnyCallPattern){
    const auto key = seed::expand<TypeParam>(987654321);
    TypeParam a{key};
    TypeParam b{key};

    for(int i = 0; i < 256; ++i){
        EXPECT_EQ(a.next_u32(), b.next_u32());
        EXPECT_EQ(a.next_u64(), b.next_u64());
        std::array<std::uint8_t, 11> ba{};
        std::array<std::uint8_t, 11> bb{};
        a.fill_bytes(ba);
        b.fill_bytes(bb);
        EXPECT_EQ(ba, bb);
    }
}

TYPED_TEST(EngineTypedTest, DifferentSeedsProduceDifferentSequences){
    auto a = seeded<TypeParam>(1);
    auto b = seeded<TypeParam>(2);

    bool all_equal = true;
    for(int i = 0; i < 32; ++i){
        if(a.next_u64() != b.next_u64()){
            all_equal = false;
            break;
        }
    }
    EXPECT_FALSE(all_equal)
        << "Different seeds should not produce identical sequences (at least not for 32 steps)";
}

TYPED_TEST(EngineTypedTest, NextProducesDifferentValuesOverTime){
    const auto v1 = this->rng.next_u64();
    const auto v2 = this->rng.next_u64();
    const auto v3 = this->rng.next_u64();
    // smoke test only
    EXPECT_NE(v1, v2);
    EXPECT_NE(v2, v3);
}

// -----------------------------------------------------------------------------
// Value semantics: copies are independent, operator== follows state
// -----------------------------------------------------------------------------
TYPED_TEST(EngineTypedTest, CopyIsIndependentAndReplaysTheSameStream){
    TypeParam copy = this->rng;
    std::vector<typename TypeParam::result_type> original;
    for(int i = 0; i < 64; ++i){
        original.push_back(this->rng());
    }
    for(int i = 0; i < 64; ++i){
        EXPECT_EQ(copy(), original[i]);
    }
}

TYPED_TEST(EngineTypedTest, EqualityTracksState){
    TypeParam a = seeded<TypeParam>(7);
    TypeParam b = seeded<TypeParam>(7);

    EXPECT_TRUE(a == b);

    a.next_u64();
    EXPECT_FALSE(a == b);

    b.next_u64();
    EXPECT_TRUE(a == b);

    a();
    a();
    b();
    EXPECT_FALSE(a == b);

    b();
    EXPECT_TRUE(a == b);
}

// -----------------------------------------------------------------------------
// discard(n) is equivalent to drawing n native words
// -----------------------------------------------------------------------------
TYPED_TEST(EngineTypedTest, DiscardSkipsValues){
    TypeParam a = seeded<TypeParam>(123);
    TypeParam b = seeded<TypeParam>(123);

    constexpr unsigned long long skip = 25;
    a.discard(skip);
    for(unsigned long long i = 0; i < skip; ++i){
        b();
    }
    EXPECT_TRUE(a == b);
    EXPECT_EQ(a(), b());
}

// -----------------------------------------------------------------------------
// Byte serialization
// -----------------------------------------------------------------------------
TYPED_TEST(EngineTypedTest, FillingEightBytesMatchesOneNextU64){
    TypeParam reference = this->rng;
    std::array<std::uint8_t, 8> buf{};
    this->rng.fill_bytes(buf);

    const auto expected = le_bytes(reference.next_u64(), 8);
    EXPECT_TRUE(std::ranges::equal(buf, expected));
    EXPECT_TRUE(this->rng == reference);
}

TYPED_TEST(EngineTypedTest, FillingSixteenBytesMatchesTwoNextU64){
    TypeParam reference = this->rng;
    std::array<std::uint8_t, 16> buf{};
    this->rng.fill_bytes(buf);

    auto expected = le_bytes(reference.next_u64(), 8);
    const auto second = le_bytes(reference.next_u64(), 8);
    expected.insert(expected.end(), second.begin(), second.end());
    EXPECT_TRUE(std::ranges::equal(buf, expected));
}

TYPED_TEST(EngineTypedTest, ShortFillWritesLeadingBytesOfOneWord){
    TypeParam reference = this->rng;
    std::array<std::uint8_t, 3> buf{};
    this->rng.fill_bytes(buf);

    const auto expected = le_bytes(reference(), 3);
    EXPECT_TRUE(std::ranges::equal(buf, expected));
    EXPECT_TRUE(this->rng == reference) << "a short fill must consume exactly one native word";
}

TYPED_TEST(EngineTypedTest, UnusedBytesOfTheFinalWordAreDiscarded){
    TypeParam reference = this->rng;
    std::array<std::uint8_t, 1> one{};
    this->rng.fill_bytes(one);
    reference();

    // the next fill starts with a fresh word, not the 7 (or 3) leftover bytes
    std::array<std::uint8_t, sizeof(typename TypeParam::result_type)> next{};
    this->rng.fill_bytes(next);
    const auto expected = le_bytes(reference(), next.size());
    EXPECT_TRUE(std::ranges::equal(next, expected));
}

TYPED_TEST(EngineTypedTest, OddLengthFillIsWordsInSequence){
    using word = typename TypeParam::result_type;
    TypeParam reference = this->rng;
    std::array<std::uint8_t, 29> buf{};
    this->rng.fill_bytes(buf);

    std::vector<std::uint8_t> expected;
    while(expected.size() < buf.size()){
        const auto bytes = le_bytes(reference(), sizeof(word));
        expected.insert(expected.end(), bytes.begin(), bytes.end());
    }
    expected.resize(buf.size());
    EXPECT_TRUE(std::ranges::equal(buf, expected));
    EXPECT_TRUE(this->rng == reference);
}

TYPED_TEST(EngineTypedTest, EmptyFillDoesNotAdvance){
    TypeParam reference = this->rng;
    this->rng.fill_bytes(std::span<std::uint8_t>{});
    EXPECT_TRUE(this->rng == reference);
}

// -----------------------------------------------------------------------------
// Seeding
// -----------------------------------------------------------------------------
TYPED_TEST(EngineTypedTest, FromBytesRejectsWrongSeedLength){
    const std::vector<std::uint8_t> too_short(TypeParam::seed_size - 1, 0x5a);
    const std::vector<std::uint8_t> too_long(TypeParam::seed_size + 1, 0x5a);
    EXPECT_THROW((void)from_bytes<TypeParam>(too_short), seed_error);
    EXPECT_THROW((void)from_bytes<TypeParam>(too_long), seed_error);
    EXPECT_THROW((void)from_bytes<TypeParam>(std::span<const std::uint8_t>{}), seed_error);
}

TYPED_TEST(EngineTypedTest, FromBytesMatchesSeedConstructor){
    const auto key = seed::expand<TypeParam>(42);
    const std::vector<std::uint8_t> bytes(key.begin(), key.end());
    EXPECT_TRUE(from_bytes<TypeParam>(bytes) == TypeParam{key});
}

TYPED_TEST(EngineTypedTest, AllZeroSeedTerminatesWithoutFault){
    const typename TypeParam::seed_type zeros{};
    if constexpr(std::is_same_v<TypeParam, Msws>){
        EXPECT_THROW((void)TypeParam{zeros}, seed_error); // stream constant 0 | 1 has no high bits
    } else{
        TypeParam rng{zeros};
        std::array<std::uint8_t, 64> buf{};
        rng.fill_bytes(buf);
        for(int i = 0; i < 16; ++i){
            rng.next_u32();
            rng.next_u64();
        }
        SUCCEED();
    }
}

TYPED_TEST(EngineTypedTest, ExpandedSeedsAreDeterministic){
    constexpr auto s1 = seed::expand<TypeParam>(seed::from_text("practrand"));
    const auto s2 = seed::expand<TypeParam>(seed::from_text("practrand"));
    const auto s3 = seed::expand<TypeParam>(seed::from_text("testu01"));
    EXPECT_EQ(s1, s2);
    EXPECT_NE(s1, s3);
}

// -----------------------------------------------------------------------------
// Interop with <random>
// -----------------------------------------------------------------------------
TYPED_TEST(EngineTypedTest, WorksWithStandardDistributions){
    std::uniform_int_distribution<int> die(1, 6);
    for(int i = 0; i < 1024; ++i){
        const int v = die(this->rng);
        EXPECT_GE(v, 1);
        EXPECT_LE(v, 6);
    }
    std::vector<int> vec{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    std::shuffle(vec.begin(), vec.end(), this->rng);
    EXPECT_TRUE(std::ranges::is_permutation(vec, std::vector<int>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));
}

// -----------------------------------------------------------------------------
// Golden vectors, seed bytes 1, 2, 3 ... seed_size
// -----------------------------------------------------------------------------
template<class Engine>
typename Engine::seed_type counting_seed(){
    typename Engine::seed_type seed{};
    for(std::size_t i = 0; i < seed.size(); ++i){
        seed[i] = static_cast<std::uint8_t>(i + 1);
    }
    return seed;
}

template<class Engine>
std::vector<std::uint32_t> first_u32(std::size_t n){
    Engine rng{counting_seed<Engine>()};
    std::vector<std::uint32_t> out(n);
    for(auto& v : out){ v = rng.next_u32(); }
    return out;
}

template<class Engine>
std::vector<std::uint64_t> first_u64(std::size_t n){
    Engine rng{counting_seed<Engine>()};
    std::vector<std::uint64_t> out(n);
    for(auto& v : out){ v = rng.next_u64(); }
    return out;
}

template<class Engine>
std::vector<std::uint8_t> first_bytes(std::size_t n){
    Engine rng{counting_seed<Engine>()};
    std::vector<std::uint8_t> out(n);
    rng.fill_bytes(out);
    return out;
}

TEST(GoldenVectors, Msws){
    EXPECT_EQ(first_u64<Msws>(4), (std::vector<std::uint64_t>{
        0xb92db652c3de1059ULL, 0x26b2b64630cc2abaULL, 0xcf28a127bcfe72a5ULL, 0xe3ae1bf513094b69ULL}));
    EXPECT_EQ(first_u32<Msws>(4), (std::vector<std::uint32_t>{0xc3de1059u, 0x30cc2abau, 0xbcfe72a5u, 0x13094b69u}));
    EXPECT_EQ(first_bytes<Msws>(13), to_vector({0x59, 0x10, 0xde, 0xc3, 0x52, 0xb6, 0x2d, 0xb9, 0xba, 0x2a, 0xcc, 0x30, 0x46}));
}

TEST(GoldenVectors, PcgXsh64){
    EXPECT_EQ(first_u32<PcgXsh64>(4), (std::vector<std::uint32_t>{0x4f1f04a0u, 0xb43c2576u, 0xedabe6d5u, 0xf0e038aau}));
    EXPECT_EQ(first_u64<PcgXsh64>(2), (std::vector<std::uint64_t>{0xb43c25764f1f04a0ULL, 0xf0e038aaedabe6d5ULL}));
    EXPECT_EQ(first_bytes<PcgXsh64>(13), to_vector({0xa0, 0x04, 0x1f, 0x4f, 0x76, 0x25, 0x3c, 0xb4, 0xd5, 0xe6, 0xab, 0xed, 0xaa}));
}

TEST(GoldenVectors, PcgXsh64StateZeroIncrementOne){
    // seeding advances state to 0 * M + 1 = 1; XSH RR of 1 is 0, rotated by 0
    PcgXsh64 rng{to_le_bytes(std::array<std::uint64_t, 2>{0, 1})};
    EXPECT_EQ(rng.next_u32(), 0u);
    EXPECT_EQ(rng.next_u32(), 0xe4c14788u);
    EXPECT_EQ(rng.next_u32(), 0x379c6516u);
    EXPECT_EQ(rng.next_u32(), 0x5c4ab3bbu);
}

TEST(GoldenVectors, PcgXsl64){
    EXPECT_EQ(first_u32<PcgXsl64>(4), (std::vector<std::uint32_t>{0xc1473500u, 0xc39a52beu, 0x7b21ce35u, 0x30202831u}));
    EXPECT_EQ(first_u64<PcgXsl64>(2), (std::vector<std::uint64_t>{0xc39a52bec1473500ULL, 0x302028317b21ce35ULL}));
    EXPECT_EQ(first_bytes<PcgXsl64>(13), to_vector({0x00, 0x35, 0x47, 0xc1, 0xbe, 0x52, 0x9a, 0xc3, 0x35, 0xce, 0x21, 0x7b, 0x31}));
}

TEST(GoldenVectors, PcgXsl128){
    EXPECT_EQ(first_u64<PcgXsl128>(4), (std::vector<std::uint64_t>{
        0x005fc59731066494ULL, 0x5158046355a1dbb6ULL, 0xf2059081c038a751ULL, 0x3cfd9694d73b847fULL}));
    EXPECT_EQ(first_u32<PcgXsl128>(4), (std::vector<std::uint32_t>{0x31066494u, 0x55a1dbb6u, 0xc038a751u, 0xd73b847fu}));
    EXPECT_EQ(first_bytes<PcgXsl128>(13), to_vector({0x94, 0x64, 0x06, 0x31, 0x97, 0xc5, 0x5f, 0x00, 0xb6, 0xdb, 0xa1, 0x55, 0x63}));
}

TEST(GoldenVectors, Mwp){
    EXPECT_EQ(first_u64<Mwp>(4), (std::vector<std::uint64_t>{
        0x91bd83b841ff6961ULL, 0xde5b2ce1295f0869ULL, 0x5484f2dd6409e50cULL, 0xa72664ec044711a5ULL}));
    EXPECT_EQ(first_u32<Mwp>(4), (std::vector<std::uint32_t>{0x40601447u, 0x3e55de45u, 0x1fb4090fu, 0x9502f110u}));
    EXPECT_EQ(first_bytes<Mwp>(13), to_vector({0x61, 0x69, 0xff, 0x41, 0xb8, 0x83, 0xbd, 0x91, 0x69, 0x08, 0x5f, 0x29, 0xe1}));
}

TEST(GoldenVectors, Xsm32){
    EXPECT_EQ(first_u32<Xsm32>(4), (std::vector<std::uint32_t>{0x96295e09u, 0x16c524a7u, 0xa8a6db5cu, 0xa10b4825u}));
    EXPECT_EQ(first_u64<Xsm32>(2), (std::vector<std::uint64_t>{0x16c524a796295e09ULL, 0xa10b4825a8a6db5cULL}));
    EXPECT_EQ(first_bytes<Xsm32>(13), to_vector({0x09, 0x5e, 0x29, 0x96, 0xa7, 0x24, 0xc5, 0x16, 0x5c, 0xdb, 0xa6, 0xa8, 0x25}));
}

TEST(GoldenVectors, Xsm64){
    EXPECT_EQ(first_u64<Xsm64>(4), (std::vector<std::uint64_t>{
        0xf40159237046ded0ULL, 0x9d54fa86fb5eae99ULL, 0x9173128a8beecb48ULL, 0xc87177576fcb9fc9ULL}));
    EXPECT_EQ(first_u32<Xsm64>(4), (std::vector<std::uint32_t>{0x7046ded0u, 0xfb5eae99u, 0x8beecb48u, 0x6fcb9fc9u}));
    EXPECT_EQ(first_bytes<Xsm64>(13), to_vector({0xd0, 0xde, 0x46, 0x70, 0x23, 0x59, 0x01, 0xf4, 0x99, 0xae, 0x5e, 0xfb, 0x86}));
}

TEST(GoldenVectors, AllZeroSeeds){
    PcgXsl64 xsl{PcgXsl64::seed_type{}};
    EXPECT_EQ(xsl.next_u32(), 0x1u);
    EXPECT_EQ(xsl.next_u32(), 0x60629891u);

    PcgXsl128 mcg{PcgXsl128::seed_type{}}; // zero is a fixed point of an MCG
    EXPECT_EQ(mcg.next_u64(), 0u);
    EXPECT_EQ(mcg.next_u64(), 0u);

    Mwp mwp{Mwp::seed_type{}};
    EXPECT_EQ(mwp.next_u64(), 0x9d9597856f0994d0ULL);

    Xsm32 xsm32{Xsm32::seed_type{}};
    EXPECT_EQ(xsm32.next_u32(), 0xad1c051cu);

    Xsm64 xsm64{Xsm64::seed_type{}};
    EXPECT_EQ(xsm64.next_u64(), 0x23b2c9acd6680000ULL);
}

// lcg_low starts at all ones and the adder is large, so lcg_low wraps on the
// warm-up step and on most steps after it; the carry has to reach lcg_high.
TEST(GoldenVectors, Xsm32CarriesIntoHighWord){
    Xsm32 rng{to_le_bytes(std::array<std::uint32_t, 3>{0xffffffffu, 0x12345678u, 0x9e3779b9u})};
    const std::vector<std::uint32_t> expected{0x544b619au, 0xeefe424cu, 0x3a20c23cu, 0x859c32c1u, 0x26593e44u, 0x2a6a8c21u};
    for(auto v : expected){
        EXPECT_EQ(rng.next_u32(), v);
    }
}

TEST(GoldenVectors, Xsm64CarriesIntoHighWord){
    Xsm64 rng{to_le_bytes(std::array<std::uint64_t, 3>{~0ULL, 0x0123456789abcdefULL, 0x9e3779b97f4a7c15ULL})};
    const std::vector<std::uint64_t> expected{
        0x425b679a6b05b1b9ULL, 0xdda23e3872ebdc4eULL, 0x76a8d49ad6d36fffULL,
        0x60d56e3ee9010c58ULL, 0x4877948895f64c89ULL, 0x2ad82d7f85914491ULL};
    for(auto v : expected){
        EXPECT_EQ(rng.next_u64(), v);
    }
}

// -----------------------------------------------------------------------------
// Output width consistency
// -----------------------------------------------------------------------------
template<class Engine>
void expect_u64_is_two_u32(std::uint64_t seed_value){
    auto a = seeded<Engine>(seed_value);
    auto b = a;
    for(int i = 0; i < 64; ++i){
        const std::uint64_t lo = b.next_u32();
        const std::uint64_t hi = b.next_u32();
        EXPECT_EQ(a.next_u64(), lo | (hi << 32));
    }
}

template<class Engine>
void expect_u32_is_truncated_u64(std::uint64_t seed_value){
    auto a = seeded<Engine>(seed_value);
    auto b = a;
    for(int i = 0; i < 64; ++i){
        EXPECT_EQ(a.next_u32(), static_cast<std::uint32_t>(b.next_u64()));
    }
}

TEST(OutputWidth, ThirtyTwoBitEnginesConcatenateLowWordFirst){
    expect_u64_is_two_u32<PcgXsh64>(11);
    expect_u64_is_two_u32<PcgXsl64>(12);
    expect_u64_is_two_u32<Xsm32>(13);
}

TEST(OutputWidth, SixtyFourBitEnginesTruncate){
    expect_u32_is_truncated_u64<Msws>(21);
    expect_u32_is_truncated_u64<PcgXsl128>(22);
    expect_u32_is_truncated_u64<Xsm64>(23);
}

TEST(OutputWidth, MwpPathsAreIndependentButAdvanceAlike){
    Mwp a{counting_seed<Mwp>()};
    Mwp b{counting_seed<Mwp>()};
    const std::uint32_t narrow = a.next_u32();
    const std::uint64_t wide = b.next_u64();
    EXPECT_NE(narrow, static_cast<std::uint32_t>(wide));
    EXPECT_TRUE(a == b) << "one call of either width advances m and w by one step";

    a.next_u32();
    a.next_u32();
    b.next_u64();
    EXPECT_FALSE(a == b);
}

// fill_bytes always serializes the native 64-bit word, so a 1..4 byte tail is cut
// from the RXS M XS output. rand_core's fill_bytes_via_next would take it from
// next_u32 (XSH RR) instead, which gives different bytes for these lengths.
TEST(OutputWidth, MwpShortFillComesFromTheWidePath){
    Mwp rng{counting_seed<Mwp>()};
    std::array<std::uint8_t, 3> buf{};
    rng.fill_bytes(buf);
    EXPECT_EQ(buf, (std::array<std::uint8_t, 3>{0x61, 0x69, 0xff}));   // 0x...41ff6961
    EXPECT_NE(buf, (std::array<std::uint8_t, 3>{0x47, 0x14, 0x60}));   // 0x40601447
}

// -----------------------------------------------------------------------------
// Odd increments
// -----------------------------------------------------------------------------
template<class Engine>
void expect_low_bit_of_word_is_forced(std::size_t byte_index){
    for(std::uint64_t v : {0ull, 2ull, 0x1234'5678'9abc'def0ull, 0xffff'ffff'ffff'fffeull}){
        auto even = seed::expand<Engine>(v);
        even[byte_index] &= 0xfe;
        auto odd = even;
        odd[byte_index] |= 0x01;
        EXPECT_TRUE(Engine{even} == Engine{odd}) << "seed value " << v;
    }
}

TEST(OddIncrement, PcgIncrementIsForcedOdd){
    expect_low_bit_of_word_is_forced<PcgXsh64>(8); // word 1
    expect_low_bit_of_word_is_forced<PcgXsl64>(8);
}

TEST(OddIncrement, MwpMultiplierStateIsForcedOdd){
    expect_low_bit_of_word_is_forced<Mwp>(0); // word 0
}

TEST(OddIncrement, XsmAdderIsForcedOdd){
    expect_low_bit_of_word_is_forced<Xsm32>(8);  // word 2 of three 32-bit words
    expect_low_bit_of_word_is_forced<Xsm64>(16); // word 2 of three 64-bit words
}

TEST(OddIncrement, OtherWordsAreNotAdjusted){
    auto a = to_le_bytes(std::array<std::uint64_t, 2>{2, 7});
    auto b = to_le_bytes(std::array<std::uint64_t, 2>{3, 7});
    EXPECT_FALSE(PcgXsh64{a} == PcgXsh64{b}) << "the state word keeps its low bit";
}

// -----------------------------------------------------------------------------
// Msws seeding
// -----------------------------------------------------------------------------
TEST(MswsSeed, RejectedIffStreamConstantHasNoHighBits){
    struct Case{
        std::uint64_t first_word;
        bool valid;
    };
    const Case cases[] = {
        {0x0000'0000'0000'0000ull, false},
        {0x0000'0000'0000'0001ull, false},
        {0x0000'0000'ffff'fffeull, false},
        {0x0000'0000'ffff'ffffull, false},
        {0x0000'0001'0000'0000ull, true},
        {0x8000'0000'0000'0000ull, true},
        {0xb5ad'4ece'da1c'e2a8ull, true},
        {0xffff'ffff'ffff'ffffull, true},
    };
    for(const auto& c : cases){
        const auto bytes = to_le_bytes(std::array<std::uint64_t, 2>{c.first_word, 99});
        if(c.valid){
            EXPECT_NO_THROW((void)Msws{bytes}) << std::hex << c.first_word;
        } else{
            EXPECT_THROW((void)Msws{bytes}, seed_error) << std::hex << c.first_word;
        }
    }
}

TEST(MswsSeed, StreamConstantIsForcedOdd){
    const auto even = to_le_bytes(std::array<std::uint64_t, 2>{0x1234'5678'0000'0000ull, 5});
    const auto odd = to_le_bytes(std::array<std::uint64_t, 2>{0x1234'5678'0000'0001ull, 5});
    EXPECT_TRUE(Msws{even} == Msws{odd});
}

TEST(MswsSeed, SeedErrorExplainsTheProblem){
    try{
        (void)Msws{Msws::seed_type{}};
        FAIL() << "expected seed_error";
    } catch(const seed_error& e){
        EXPECT_NE(std::string(e.what()).find("high 32 bits"), std::string::npos);
    }
    try{
        (void)from_bytes<Msws>(std::vector<std::uint8_t>(3));
        FAIL() << "expected seed_error";
    } catch(const seed_error& e){
        EXPECT_NE(std::string(e.what()).find("16"), std::string::npos);
    }
}

TEST(MswsSeed, FromRngRetriesUntilHighBitsAreSet){
    ScriptedSource source{{0x0000'0000'0000'0000ull, 0x0000'0000'ffff'fffeull, 0x1234'5678'0000'0000ull, 42ull}};
    Msws rng = Msws::from_rng(source);
    EXPECT_EQ(source.drawn, 4u) << "two rejected draws, one accepted, one for x";

    // identical to seeding with stream 0x1234567800000000 (forced odd) and x = 42
    const Msws expected{to_le_bytes(std::array<std::uint64_t, 2>{0x1234'5678'0000'0000ull, 42})};
    EXPECT_TRUE(rng == expected);
}

TEST(MswsSeed, FromRngAcceptsFirstDrawWhenValid){
    ScriptedSource source{{0xdead'beef'0000'0002ull, 7ull}};
    Msws rng = Msws::from_rng(source);
    EXPECT_EQ(source.drawn, 2u);
    EXPECT_TRUE(rng == Msws(to_le_bytes(std::array<std::uint64_t, 2>{0xdead'beef'0000'0003ull, 7})));
}

TEST(MswsSeed, FromRngWithAnotherEngineIsDeterministic){
    auto source_a = seeded<PcgXsl128>(5);
    auto source_b = seeded<PcgXsl128>(5);
    Msws a = Msws::from_rng(source_a);
    Msws b = Msws::from_rng(source_b);
    EXPECT_TRUE(a == b);
    EXPECT_TRUE(source_a == source_b);
    for(int i = 0; i < 64; ++i){
        EXPECT_EQ(a(), b());
    }
}

// -----------------------------------------------------------------------------
// Validation: native 128-bit multiply vs two-limb fallback
// -----------------------------------------------------------------------------
TEST(Wide128, PortableMultiplyMatchesNative){
#if !defined(__SIZEOF_INT128__)
    GTEST_SKIP() << "No native 128-bit integer to compare against.";
#else
    using detail::u128;
    const u128 mult{2549297995355413924ULL, 4865540595714422341ULL};
    u128 x{0x0807060504030201ULL, 0x100f0e0d0c0b0a09ULL};
    for(int i = 0; i < 1000; ++i){
        const u128 portable = detail::mul128_portable(x, mult);
        const u128 native = detail::mul128(x, mult);
        ASSERT_EQ(portable.hi, native.hi) << "step " << i;
        ASSERT_EQ(portable.lo, native.lo) << "step " << i;
        x = native;
    }
    const u128 all_ones{UINT64_MAX, UINT64_MAX};
    EXPECT_TRUE(detail::mul128(all_ones, all_ones) == (u128{0, 1}));
    EXPECT_TRUE(detail::mul128_portable(all_ones, all_ones) == (u128{0, 1}));
#endif
}

TEST(Wide128, CarryFromLowLimbReachesHighLimb){
    using detail::u128;
    // (2^64 - 1) * 2 = 2^65 - 2
    EXPECT_TRUE(detail::mul128_portable(u128{0, UINT64_MAX}, u128{0, 2}) == (u128{1, 0xFFFF'FFFF'FFFF'FFFEull}));
    // 2^64 * 2^64 wraps to zero
    EXPECT_TRUE(detail::mul128_portable(u128{1, 0}, u128{1, 0}) == (u128{0, 0}));
}

// -----------------------------------------------------------------------------
// Byte helpers
// -----------------------------------------------------------------------------
TEST(Bytes, ReadLeDecodesLittleEndianWords){
    constexpr byte_array<8> bytes{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    constexpr auto as32 = read_le<std::uint32_t>(bytes);
    constexpr auto as64 = read_le<std::uint64_t>(bytes);
    static_assert(as32[0] == 0x04030201u && as32[1] == 0x08070605u);
    static_assert(as64[0] == 0x0807060504030201ULL);
    static_assert(to_le_bytes(as32) == bytes);
    static_assert(to_le_bytes(as64) == bytes);
    SUCCEED();
}

TEST(Bytes, FillTruncatesTheFinalWord){
    std::uint32_t counter = 0x0a0b0c0d;
    std::array<std::uint8_t, 6> buf{};
    fill_bytes_via_next<std::uint32_t>(buf, [&counter]() noexcept -> std::uint32_t{ return counter++; });
    EXPECT_EQ(counter, 0x0a0b0c0fu) << "two words drawn";
    EXPECT_EQ(buf, (std::array<std::uint8_t, 6>{0x0d, 0x0c, 0x0b, 0x0a, 0x0e, 0x0c}));
}

int main(int argc, char** argv){
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
