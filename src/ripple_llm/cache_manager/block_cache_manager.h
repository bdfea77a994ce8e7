/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <queue>
#include <unordered_set>

#include "ripple_llm/cache_manager/cache_manager_interface.h"
#include "ripple_llm/utils/environment.h"

namespace ripple_llm {

// A cache manager that hands out blocks from a fixed free list.
class BlockCacheManager : public CacheManagerInterface {
 public:
  explicit BlockCacheManager(const CacheManagerConfig& cache_manager_config);
  ~BlockCacheManager() {}

  size_t GetAvailableBlockNumber() override { return free_blocks_.size(); }

  size_t GetMaxBlocksPerSequence() override { return cache_manager_config_.max_blocks_per_sequence; }

  size_t GetBlockTokenNumber() override { return cache_manager_config_.block_token_num; }

  // Get the number of blocks held by sequences.
  size_t GetUsedBlockNumber() const { return used_blocks_.size(); }

  Status AllocateBlocks(int64_t req_id, size_t token_num, BlockTable& block_table) override;

  Status FreeBlocks(int64_t req_id, BlockTable& block_table) override;

 private:
  CacheManagerConfig cache_manager_config_;

  // The free block ids.
  std::queue<int> free_blocks_;

  // The block ids held by some block table.
  std::unordered_set<int> used_blocks_;
};

}  // namespace ripple_llm
