// Repository: DeckSync
// Component: Identifier Generation
// Purpose: Random command ids and authority epochs.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_UTIL_IDENTIFIERS_HPP_
#define DECKSYNC_UTIL_IDENTIFIERS_HPP_

#include <string>

namespace decksync::util {

// RFC 4122 version 4 UUID, lowercase hex with dashes.
std::string GenerateUuidV4();

}  // namespace decksync::util

#endif  // DECKSYNC_UTIL_IDENTIFIERS_HPP_
