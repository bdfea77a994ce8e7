/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/cache_manager/block_cache_manager.h"

#include "fmt/core.h"

#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/ret_code.h"

namespace ripple_llm {

BlockCacheManager::BlockCacheManager(const CacheManagerConfig& cache_manager_config)
    : cache_manager_config_(cache_manager_config) {
  RLLM_CHECK_WITH_INFO(cache_manager_config_.block_token_num > 0, "block_token_num must be positive.");
  RLLM_CHECK_WITH_INFO(cache_manager_config_.max_blocks_per_sequence > 0, "max_blocks_per_sequence must be positive.");

  for (size_t i = 0; i < cache_manager_config_.block_num; ++i) {
    free_blocks_.push(static_cast<int>(i));
  }
  RLLM_LOG_DEBUG << fmt::format("BlockCacheManager initialized, block num: {}, block token num: {}, max blocks: {}",
                                cache_manager_config_.block_num, cache_manager_config_.block_token_num,
                                cache_manager_config_.max_blocks_per_sequence);
}

Status BlockCacheManager::AllocateBlocks(int64_t req_id, size_t token_num, BlockTable& block_table) {
  size_t block_token_num = cache_manager_config_.block_token_num;
  size_t needed_block_num = (token_num + block_token_num - 1) / block_token_num;
  if (needed_block_num > cache_manager_config_.max_blocks_per_sequence) {
    return Status(RET_EXCEED_LENGTH, fmt::format("Allocate {} tokens for req {} error, exceed max {} blocks.",
                                                 token_num, req_id, cache_manager_config_.max_blocks_per_sequence));
  }

  if (needed_block_num <= block_table.GetBlockNumber()) {
    return Status();
  }

  size_t block_num = needed_block_num - block_table.GetBlockNumber();
  if (block_num > free_blocks_.size()) {
    return Status(RET_CACHE_EXHAUSTED,
                  fmt::format("Allocate {} blocks for req {} error, only {} free.", block_num, req_id,
                              free_blocks_.size()));
  }

  for (size_t i = 0; i < block_num; ++i) {
    int block_id = free_blocks_.front();
    free_blocks_.pop();
    used_blocks_.insert(block_id);
    block_table.block_ids.push_back(block_id);
  }

  return Status();
}

Status BlockCacheManager::FreeBlocks(int64_t req_id, BlockTable& block_table) {
  if (block_table.IsEmpty()) {
    return Status(RET_FREE_FAIL, fmt::format("Free blocks of req {} error, no block allocated.", req_id));
  }

  for (int block_id : block_table.block_ids) {
    if (used_blocks_.find(block_id) == used_blocks_.end()) {
      return Status(RET_FREE_FAIL,
                    fmt::format("Free blocks of req {} error, block {} is not in use.", req_id, block_id));
    }
  }

  for (int block_id : block_table.block_ids) {
    used_blocks_.erase(block_id);
    free_blocks_.push(block_id);
  }
  block_table.block_ids.clear();

  return Status();
}

}  // namespace ripple_llm
