/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <cstddef>
#include <vector>

namespace ripple_llm {

// The cache blocks held by one sequence. Only moved, never copied, so that one block id
// could not be released twice through two copies of the table.
struct BlockTable {
  BlockTable() {}
  BlockTable(const BlockTable&) = delete;
  BlockTable& operator=(const BlockTable&) = delete;
  BlockTable(BlockTable&&) = default;
  BlockTable& operator=(BlockTable&&) = default;

  bool IsEmpty() const { return block_ids.empty(); }

  size_t GetBlockNumber() const { return block_ids.size(); }

  // The block ids, in token order.
  std::vector<int> block_ids;
};

}  // namespace ripple_llm
