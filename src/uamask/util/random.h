// Copyright 2026 uamask Authors
// SPDX-License-Identifier: MIT

#ifndef UAMASK_UTIL_RANDOM_H_
#define UAMASK_UTIL_RANDOM_H_

#include <cstdint>
#include <random>

namespace uamask {

// Randomness source injected into corpus draws and client-hint synthesis.
// Seed it explicitly for reproducible output.
using Rng = std::mt19937;

// Non-deterministically seeded generator for production use
inline Rng MakeRng() { return Rng(std::random_device{}()); }

// Deterministic generator (tests, replay)
inline Rng MakeRng(uint32_t seed) { return Rng(seed); }

}  // namespace uamask

#endif  // UAMASK_UTIL_RANDOM_H_
