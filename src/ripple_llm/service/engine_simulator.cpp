/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/service/engine_simulator.h"

#include <algorithm>

#include "fmt/core.h"

#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/ret_code.h"

namespace ripple_llm {

EngineSimulator::EngineSimulator(const RequestHandlerConfig& request_handler_config,
                                 const CacheManagerConfig& cache_manager_config,
                                 const GenerationConfig& generation_config, const SimulatorConfig& simulator_config)
    : request_handler_config_(request_handler_config),
      generation_config_(generation_config),
      simulator_config_(simulator_config),
      generator_(generation_config.seed) {
  cache_manager_ = std::make_shared<BlockCacheManager>(cache_manager_config);
  sampler_ = std::make_shared<Sampler>(generation_config.seed);
  request_handler_ = std::make_unique<RequestHandler>(request_handler_config_, cache_manager_, sampler_);
}

Status EngineSimulator::AddRequests() {
  std::uniform_int_distribution<size_t> prompt_len_dist(1, request_handler_config_.max_input_len - 1);
  std::uniform_int_distribution<int> token_dist(0, static_cast<int>(simulator_config_.vocab_size) - 1);
  for (size_t i = 0; i < simulator_config_.request_num; ++i) {
    std::vector<int> input_tokens(prompt_len_dist(generator_));
    for (int& token : input_tokens) {
      token = token_dist(generator_);
    }

    // The beams of one request are added next to each other, so that they stay in one group.
    for (size_t beam = 0; beam < generation_config_.num_beams; ++beam) {
      int64_t req_id = static_cast<int64_t>(i * generation_config_.num_beams + beam);
      int64_t group_id = static_cast<int64_t>(i);
      STATUS_CHECK_RETURN(request_handler_->AddSequence(std::make_shared<Sequence>(req_id, input_tokens, group_id)));
    }
  }
  return Status();
}

void EngineSimulator::Forward(const BatchInfo& batch, std::vector<float>& logits) {
  std::normal_distribution<float> logit_dist(0.0f, 2.0f);
  logits.resize(batch.Size() * simulator_config_.vocab_size);
  for (float& logit : logits) {
    logit = logit_dist(generator_);
  }
}

Status EngineSimulator::Start() {
  if (request_handler_config_.max_input_len < 2) {
    return Status(RET_INVALID_ARGUMENT, "max_input_len should be at least 2 to fake prompts.");
  }
  STATUS_CHECK_RETURN(AddRequests());

  uint64_t start_time_ms = GetCurrentTimeInMs();
  size_t step = 0;
  size_t generated_token_num = 0;
  std::vector<float> logits;
  while (request_handler_->HasUnfinishedSequences() && !terminated_) {
    if (step >= simulator_config_.max_step_num) {
      return Status(RET_RUNTIME, fmt::format("Simulation not finished after {} steps.", step));
    }
    ++step;

    const BatchInfo& batch = request_handler_->Schedule();
    if (batch.IsEmpty()) {
      if (request_handler_->GetRunningList().IsEmpty()) {
        return Status(RET_CACHE_EXHAUSTED, "No request could be admitted, the cache is too small.");
      }
      continue;
    }

    Forward(batch, logits);
    STATUS_CHECK_RETURN(request_handler_->SearchTokens(logits, simulator_config_.vocab_size, generation_config_));
    generated_token_num += batch.Size();

    request_handler_->Update();
    uint64_t now_ms = GetCurrentTimeInMs();
    for (const auto& seq : request_handler_->ReleaseDoneSequences()) {
      if (seq->GetStatus() == REQUEST_STATUS_FINISHED) {
        ++finished_num_;
        uint64_t latency_ms = now_ms - seq->GetArrivalTimeMs();
        total_latency_ms_ += latency_ms;
        max_latency_ms_ = std::max(max_latency_ms_, latency_ms);
      } else {
        ++aborted_num_;
        RLLM_LOG_WARNING << fmt::format("Req {} aborted: {}", seq->GetReqId(), seq->GetFinishStatus().ToString());
      }
    }
  }

  uint64_t cost_ms = GetCurrentTimeInMs() - start_time_ms;
  RLLM_LOG_INFO << fmt::format("Simulation done in {} steps, {} ms, finished {}, aborted {}, generated {} tokens.",
                               step, cost_ms, finished_num_, aborted_num_, generated_token_num);
  RLLM_LOG_INFO << fmt::format("Request latency avg {:.2f} ms, max {} ms.", GetAverageLatencyMs(), max_latency_ms_);
  return Status();
}

}  // namespace ripple_llm
