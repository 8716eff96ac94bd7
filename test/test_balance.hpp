// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Catch2 printing for 128-bit balances

#ifndef POWLEDGER_TEST_BALANCE_HPP
#define POWLEDGER_TEST_BALANCE_HPP

#include <catch2/catch_tostring.hpp>
#include "util/string_parsing.hpp"
#include "util/uint128.hpp"
#include <string>

namespace Catch {
template <>
struct StringMaker<powledger::util::uint128_t> {
    static std::string convert(powledger::util::uint128_t value) {
        return powledger::util::FormatU128(value);
    }
};
} // namespace Catch

#endif // POWLEDGER_TEST_BALANCE_HPP
