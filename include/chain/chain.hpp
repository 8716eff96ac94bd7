// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <vector>

namespace powledger {
namespace chain {

// Chain - append-only sequence of accepted blocks
// Height h is the h-th block appended (genesis = 0). Blocks are owned by the
// chain and never removed or reordered.

class Chain {
private:
  std::vector<Block> vChain;

public:
  Chain() = default;

  // Prevent copying (chains should be owned, not copied)
  Chain(const Chain &) = delete;
  Chain &operator=(const Chain &) = delete;

  const Block *Genesis() const {
    return vChain.size() > 0 ? &vChain[0] : nullptr;
  }

  const Block *Tip() const {
    return vChain.size() > 0 ? &vChain[vChain.size() - 1] : nullptr;
  }

  const Block *operator[](int nHeight) const {
    if (nHeight < 0 || nHeight >= (int)vChain.size())
      return nullptr;
    return &vChain[nHeight];
  }

  // Return maximal height in chain (-1 when empty)
  int Height() const { return int(vChain.size()) - 1; }

  size_t Size() const { return vChain.size(); }
  bool Empty() const { return vChain.empty(); }

  // Append as the new tip; returns its height
  int Append(Block block);

  // Height of the block whose stored hash is `hash`, -1 if absent
  int FindHeight(const BlockHash &hash) const;

  // Oldest to newest
  std::vector<Block>::const_iterator begin() const { return vChain.begin(); }
  std::vector<Block>::const_iterator end() const { return vChain.end(); }

  // Mutable access for tamper tests only
  Block *GetMutable(int nHeight) {
    if (nHeight < 0 || nHeight >= (int)vChain.size())
      return nullptr;
    return &vChain[nHeight];
  }
};

} // namespace chain
} // namespace powledger
