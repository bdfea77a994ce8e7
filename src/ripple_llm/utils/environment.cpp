/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/utils/environment.h"

#include <string>

#include "fmt/core.h"
#include "gflags/gflags.h"

#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/ret_code.h"
#include "ripple_llm/utils/status.h"
#include "ripple_llm/utils/string_utils.h"
#include "ripple_llm/utils/yaml_reader.h"

DEFINE_string(config_file, "examples/ripple_llm.yaml", "The config file path");
DEFINE_int32(request_num, 16, "The number of faked requests, default is 16");
DEFINE_int32(vocab_size, 1024, "The vocab size of faked logits, default is 1024");

namespace ripple_llm {

Status Environment::ParseConfig(const std::string &config_file) {
  YamlReader yaml_reader;
  Status status = yaml_reader.LoadFile(config_file);
  if (!status.OK()) {
    RLLM_LOG_ERROR << "Load yaml config error." << status.GetMessage();
    return status;
  }

  // Start from the defaults, a missing key keeps its default value.
  request_handler_config_ = RequestHandlerConfig();
  cache_manager_config_ = CacheManagerConfig();
  generation_config_ = GenerationConfig();

  // Read request handler setting.
  STATUS_CHECK_RETURN(
      yaml_reader.GetScalar("setting.request_handler.max_input_len", request_handler_config_.max_input_len));
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.request_handler.ratio", request_handler_config_.ratio));
  STATUS_CHECK_RETURN(
      yaml_reader.GetScalar("setting.request_handler.bucket_num", request_handler_config_.waiting_bucket_num));

  // Read cache manager setting.
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.cache_manager.block_num", cache_manager_config_.block_num));
  STATUS_CHECK_RETURN(
      yaml_reader.GetScalar("setting.cache_manager.block_token_num", cache_manager_config_.block_token_num));
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.cache_manager.max_blocks_per_sequence",
                                            cache_manager_config_.max_blocks_per_sequence));

  // Read generation setting.
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.generation.eos_id", generation_config_.eos_id));
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.generation.max_output_len", generation_config_.max_output_len));
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.generation.num_beams", generation_config_.num_beams));
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.generation.do_sample", generation_config_.do_sample));
  STATUS_CHECK_RETURN(
      yaml_reader.GetScalarList("setting.generation.logits_processors", generation_config_.logits_processors));
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.generation.top_k", generation_config_.top_k));
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.generation.top_p", generation_config_.top_p));
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.generation.min_p", generation_config_.min_p));
  STATUS_CHECK_RETURN(yaml_reader.GetScalar("setting.generation.seed", generation_config_.seed));

  if (cache_manager_config_.max_blocks_per_sequence == 0 && cache_manager_config_.block_token_num > 0) {
    size_t max_token_len = request_handler_config_.max_input_len + generation_config_.max_output_len;
    cache_manager_config_.max_blocks_per_sequence =
        (max_token_len + cache_manager_config_.block_token_num - 1) / cache_manager_config_.block_token_num;
  }

  status = CheckEnvironment();
  if (!status.OK()) {
    RLLM_LOG_ERROR << fmt::format("Check config file {} error: {}", config_file, status.GetMessage());
    return status;
  }

  RLLM_LOG_INFO << fmt::format(
      "Load config {} success, max_input_len {}, ratio {}, block_num {}, max_blocks_per_sequence {}, "
      "logits_processors {}",
      config_file, request_handler_config_.max_input_len, request_handler_config_.ratio,
      cache_manager_config_.block_num, cache_manager_config_.max_blocks_per_sequence,
      Vector2Str(generation_config_.logits_processors));
  return Status();
}

Status Environment::ParseOptions(int argc, char **argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (FLAGS_request_num <= 0 || FLAGS_vocab_size <= 0) {
    return Status(RET_INVALID_ARGUMENT,
                  fmt::format("Invalid options, request_num {}, vocab_size {}.", FLAGS_request_num, FLAGS_vocab_size));
  }
  simulator_config_.request_num = static_cast<size_t>(FLAGS_request_num);
  simulator_config_.vocab_size = static_cast<size_t>(FLAGS_vocab_size);

  Status status = ParseConfig(FLAGS_config_file);
  if (!status.OK()) {
    RLLM_LOG_ERROR << fmt::format("Parse config file {} error: {}", FLAGS_config_file, status.GetMessage());
    return status;
  }

  return Status();
}

Status Environment::CheckEnvironment() {
  if (request_handler_config_.max_input_len == 0) {
    return Status(RET_INVALID_ARGUMENT, "max_input_len must be positive.");
  }

  if (request_handler_config_.ratio < 0.0f) {
    return Status(RET_INVALID_ARGUMENT,
                  fmt::format("ratio must be non-negative, got {}.", request_handler_config_.ratio));
  }

  if (request_handler_config_.waiting_bucket_num == 0) {
    return Status(RET_INVALID_ARGUMENT, "bucket_num must be positive.");
  }

  if (cache_manager_config_.block_num == 0 || cache_manager_config_.block_token_num == 0) {
    return Status(RET_INVALID_ARGUMENT, fmt::format("Invalid cache config, block_num {}, block_token_num {}.",
                                                    cache_manager_config_.block_num,
                                                    cache_manager_config_.block_token_num));
  }

  // A prompt that passes the length check must also fit into the blocks of one sequence.
  if (cache_manager_config_.max_blocks_per_sequence * cache_manager_config_.block_token_num <
      request_handler_config_.max_input_len) {
    return Status(RET_INVALID_ARGUMENT,
                  fmt::format("max_blocks_per_sequence {} with block_token_num {} could not hold max_input_len {}.",
                              cache_manager_config_.max_blocks_per_sequence, cache_manager_config_.block_token_num,
                              request_handler_config_.max_input_len));
  }

  if (generation_config_.num_beams == 0) {
    return Status(RET_INVALID_ARGUMENT, "num_beams must be positive.");
  }

  if (generation_config_.max_output_len == 0) {
    return Status(RET_INVALID_ARGUMENT, "max_output_len must be positive.");
  }

  return Status();
}

Status Environment::GetRequestHandlerConfig(RequestHandlerConfig &request_handler_config) {
  request_handler_config = request_handler_config_;
  return Status();
}

Status Environment::GetCacheManagerConfig(CacheManagerConfig &cache_manager_config) {
  cache_manager_config = cache_manager_config_;
  return Status();
}

Status Environment::GetGenerationConfig(GenerationConfig &generation_config) {
  generation_config = generation_config_;
  return Status();
}

Status Environment::GetSimulatorConfig(SimulatorConfig &simulator_config) {
  simulator_config = simulator_config_;
  return Status();
}

}  // namespace ripple_llm
