// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chain.hpp"
#include "util/logging.hpp"

namespace powledger {
namespace chain {

int Chain::Append(Block block) {
  vChain.push_back(std::move(block));
  const int height = Height();

  LOG_CHAIN_TRACE("Chain::Append: new_tip={} height={}",
                  vChain.back().GetHash().substr(0, 16), height);
  return height;
}

int Chain::FindHeight(const BlockHash &hash) const {
  for (size_t i = 0; i < vChain.size(); ++i) {
    if (vChain[i].GetHash() == hash) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

} // namespace chain
} // namespace powledger
