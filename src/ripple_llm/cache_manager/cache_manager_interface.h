/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <cstdint>

#include "ripple_llm/cache_manager/block_table.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

// The block accounting contract used by the request handler.
class CacheManagerInterface {
 public:
  virtual ~CacheManagerInterface() {}

  // Get the free block number.
  virtual size_t GetAvailableBlockNumber() = 0;

  // Get the max block number one sequence could hold.
  virtual size_t GetMaxBlocksPerSequence() = 0;

  // The max token number of one block.
  virtual size_t GetBlockTokenNumber() = 0;

  // Grow the block table so that it could hold token_num tokens. Either all the needed blocks are
  // allocated, or the table is not changed and RET_CACHE_EXHAUSTED is returned.
  virtual Status AllocateBlocks(int64_t req_id, size_t token_num, BlockTable& block_table) = 0;

  // Release all the blocks of the table and leave it empty. Free an empty table is an error.
  virtual Status FreeBlocks(int64_t req_id, BlockTable& block_table) = 0;
};

}  // namespace ripple_llm
