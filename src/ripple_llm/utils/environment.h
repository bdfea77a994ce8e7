/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#pragma once

#include <string>
#include <vector>

#include "ripple_llm/utils/status.h"

namespace ripple_llm {

struct RequestHandlerConfig {
  // The max prompt length, a prompt must be strictly shorter than this.
  size_t max_input_len = 256;

  // The prefill/decoding size ratio that must be reached before a prefill step interrupts decoding.
  float ratio = 1.2f;

  // The number of priority buckets of the waiting queue.
  size_t waiting_bucket_num = 3;
};

struct CacheManagerConfig {
  // The preallocated blocks.
  size_t block_num = 512;

  // The max token number of one block.
  size_t block_token_num = 16;

  // The max blocks one sequence could hold, derived from max input and output length if 0.
  size_t max_blocks_per_sequence = 0;
};

struct GenerationConfig {
  // The end of sentence token.
  int eos_id = 2;

  // The max generated tokens of every sequence.
  size_t max_output_len = 256;

  // Beam width, 1 means no beam search.
  size_t num_beams = 1;

  // Sample from distribution instead of picking the best token.
  bool do_sample = false;

  // The enabled logits processors, applied in the fixed order top_p, top_k, min_p.
  std::vector<std::string> logits_processors;

  int top_k = 50;
  float top_p = 1.0f;
  float min_p = 0.0f;

  // The seed of multinomial sampling.
  unsigned int seed = 0;
};

struct SimulatorConfig {
  // The number of faked requests.
  size_t request_num = 16;

  // The vocab size of faked logits.
  size_t vocab_size = 1024;

  // Stop the loop after so many steps even if some requests are unfinished.
  size_t max_step_num = 100000;
};

class Environment {
 public:
  Environment() {}

  // Parse environment from YAML config file.
  Status ParseConfig(const std::string &config_file);

  // Parse command line options.
  Status ParseOptions(int argc, char **argv);

  // Get the config of request handler.
  Status GetRequestHandlerConfig(RequestHandlerConfig &request_handler_config);

  // Get the config of cache manager.
  Status GetCacheManagerConfig(CacheManagerConfig &cache_manager_config);

  // Get the default generation config.
  Status GetGenerationConfig(GenerationConfig &generation_config);

  // Get the config of simulator.
  Status GetSimulatorConfig(SimulatorConfig &simulator_config);

 private:
  // Check Whether the environment config is valid.
  Status CheckEnvironment();

 private:
  RequestHandlerConfig request_handler_config_;
  CacheManagerConfig cache_manager_config_;
  GenerationConfig generation_config_;
  SimulatorConfig simulator_config_;
};

}  // namespace ripple_llm
