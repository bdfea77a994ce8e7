/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "ripple_llm/batch_scheduler/request_handler.h"
#include "ripple_llm/cache_manager/block_cache_manager.h"
#include "ripple_llm/samplers/sampler.h"
#include "ripple_llm/utils/environment.h"
#include "ripple_llm/utils/status.h"

namespace ripple_llm {

// Drive the request handler with faked requests and a faked forward pass.
class EngineSimulator {
 public:
  EngineSimulator(const RequestHandlerConfig& request_handler_config, const CacheManagerConfig& cache_manager_config,
                  const GenerationConfig& generation_config, const SimulatorConfig& simulator_config);

  // Run until all requests are done or Stop() is called.
  Status Start();

  // Stop the loop after current step.
  void Stop() { terminated_ = true; }

  size_t GetFinishedNumber() const { return finished_num_; }

  size_t GetAbortedNumber() const { return aborted_num_; }

  // The time from a request's arrival until it is released as finished.
  uint64_t GetMaxLatencyMs() const { return max_latency_ms_; }

  double GetAverageLatencyMs() const {
    return finished_num_ == 0 ? 0.0 : static_cast<double>(total_latency_ms_) / finished_num_;
  }

 private:
  // Submit the faked requests.
  Status AddRequests();

  // Generate random logits for every sequence of the batch.
  void Forward(const BatchInfo& batch, std::vector<float>& logits);

 private:
  RequestHandlerConfig request_handler_config_;
  GenerationConfig generation_config_;
  SimulatorConfig simulator_config_;

  std::shared_ptr<BlockCacheManager> cache_manager_;
  std::shared_ptr<Sampler> sampler_;
  std::unique_ptr<RequestHandler> request_handler_;

  std::mt19937 generator_;

  std::atomic<bool> terminated_ = false;

  size_t finished_num_ = 0;
  size_t aborted_num_ = 0;

  uint64_t total_latency_ms_ = 0;
  uint64_t max_latency_ms_ = 0;
};

}  // namespace ripple_llm
