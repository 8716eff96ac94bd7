// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

namespace powledger {
namespace util {

// Unsigned 128-bit integer. __int128 is a GCC/Clang extension; the
// __extension__ marker keeps -Wpedantic builds quiet.
__extension__ typedef unsigned __int128 uint128_t;

} // namespace util
} // namespace powledger
