// Repository: DeckSync
// Component: Identifier Generation
// Purpose: Random command ids and authority epochs.
// Copyright (c) 2025 DeckSync

#include "decksync/util/Identifiers.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <random>

namespace decksync::util {

std::string GenerateUuidV4() {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  uint64_t high = engine();
  uint64_t low = engine();

  // Version nibble 4, variant bits 10.
  high = (high & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
  low = (low & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08" PRIx64 "-%04" PRIx64 "-%04" PRIx64
                "-%04" PRIx64 "-%012" PRIx64,
                high >> 32, (high >> 16) & 0xFFFF, high & 0xFFFF,
                low >> 48, low & 0xFFFFFFFFFFFFull);
  return std::string(buf, 36);
}

}  // namespace decksync::util
