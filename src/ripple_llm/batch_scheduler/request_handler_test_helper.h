/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <vector>

#include "ripple_llm/cache_manager/block_cache_manager.h"
#include "ripple_llm/utils/ret_code.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

// A block cache manager whose allocation could be made to fail.
class FakedCacheManager : public BlockCacheManager {
 public:
  explicit FakedCacheManager(const CacheManagerConfig& cache_manager_config)
      : BlockCacheManager(cache_manager_config) {}

  Status AllocateBlocks(int64_t req_id, size_t token_num, BlockTable& block_table) override {
    if (exhausted) {
      return Status(RET_CACHE_EXHAUSTED, "faked exhausted.");
    }
    return BlockCacheManager::AllocateBlocks(req_id, token_num, block_table);
  }

  bool exhausted = false;
};

// Logits whose row i is concentrated on tokens[i].
inline std::vector<float> MakeConcentratedLogits(const std::vector<int>& tokens, size_t vocab_size) {
  std::vector<float> logits(tokens.size() * vocab_size, 0.0f);
  for (size_t row = 0; row < tokens.size(); ++row) {
    logits[row * vocab_size + tokens[row]] = 10.0f;
  }
  return logits;
}

}  // namespace ripple_llm
