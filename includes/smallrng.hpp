#pragma once
// smallrng.hpp: everything in one include.
// Seven small, fast, non-cryptographic engines that turn a fixed-size byte seed into an
// endless reproducible stream, for feeding randomness test suites such as PractRand:
//
//   engine      word   seed bytes
//   Msws        64     16   Middle Square Weyl Sequence (Widynski)
//   PcgXsh64    32     16   PCG XSH RR 64/32, LCG
//   PcgXsl64    32     16   PCG XSL RR 64/32, LCG
//   PcgXsl128   64     16   PCG XSL RR 128/64, MCG
//   Mwp         64     16   MCG + Weyl sequence with PCG output functions
//   Xsm32       32     12   XSM (Doty-Humphrey, PractRand)
//   Xsm64       64     24   XSM, 64-bit version
//
// All engines model srng::RandomBitEngine (see concepts.hpp) and std::uniform_random_bit_generator.
#include "concepts.hpp"
#include "seed_error.hpp"
#include "bytes.hpp"
#include "seeding.hpp"
#include "engines/msws.hpp"
#include "engines/mwp.hpp"
#include "engines/pcg_xsh64.hpp"
#include "engines/pcg_xsl64.hpp"
#include "engines/pcg_xsl128.hpp"
#include "engines/xsm32.hpp"
#include "engines/xsm64.hpp"
