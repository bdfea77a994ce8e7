/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/samplers/logits_processor.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include "fmt/core.h"

#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/ret_code.h"

namespace ripple_llm {

namespace {

constexpr float kNegInf = -std::numeric_limits<float>::infinity();

// Softmax of one row, masked entries get zero probability.
std::vector<float> RowSoftmax(const float* logits, size_t vocab_size) {
  float max_val = *std::max_element(logits, logits + vocab_size);
  std::vector<float> probs(vocab_size, 0.0f);
  if (std::isinf(max_val) && max_val < 0) {
    return probs;
  }

  float sum = 0.0f;
  for (size_t i = 0; i < vocab_size; ++i) {
    probs[i] = std::exp(logits[i] - max_val);
    sum += probs[i];
  }
  for (size_t i = 0; i < vocab_size; ++i) {
    probs[i] /= sum;
  }
  return probs;
}

}  // namespace

void ApplyTopP(float* logits, size_t vocab_size, float top_p) {
  if (top_p >= 1.0f || vocab_size == 0) {
    return;
  }

  std::vector<float> probs = RowSoftmax(logits, vocab_size);
  std::vector<size_t> indices(vocab_size);
  std::iota(indices.begin(), indices.end(), 0);
  std::stable_sort(indices.begin(), indices.end(), [&](size_t a, size_t b) { return probs[a] > probs[b]; });

  // The most likely token is always kept.
  float cumulative = 0.0f;
  for (size_t i = 0; i < vocab_size; ++i) {
    size_t idx = indices[i];
    if (i > 0 && cumulative >= top_p) {
      logits[idx] = kNegInf;
    }
    cumulative += probs[idx];
  }
}

void ApplyTopK(float* logits, size_t vocab_size, int top_k) {
  if (top_k <= 0 || static_cast<size_t>(top_k) >= vocab_size) {
    return;
  }

  std::vector<float> sorted(logits, logits + vocab_size);
  std::nth_element(sorted.begin(), sorted.begin() + (top_k - 1), sorted.end(), std::greater<float>());
  float kth_val = sorted[top_k - 1];
  for (size_t i = 0; i < vocab_size; ++i) {
    if (logits[i] < kth_val) {
      logits[i] = kNegInf;
    }
  }
}

void ApplyMinP(float* logits, size_t vocab_size, float min_p) {
  if (min_p <= 0.0f || vocab_size == 0) {
    return;
  }

  std::vector<float> probs = RowSoftmax(logits, vocab_size);
  float threshold = min_p * *std::max_element(probs.begin(), probs.end());
  for (size_t i = 0; i < vocab_size; ++i) {
    if (probs[i] < threshold) {
      logits[i] = kNegInf;
    }
  }
}

LogitsProcessorRegistry::LogitsProcessorRegistry() {
  processors_.emplace_back("top_p", [](float* logits, size_t vocab_size, const GenerationConfig& config) {
    ApplyTopP(logits, vocab_size, config.top_p);
  });
  processors_.emplace_back("top_k", [](float* logits, size_t vocab_size, const GenerationConfig& config) {
    ApplyTopK(logits, vocab_size, config.top_k);
  });
  processors_.emplace_back("min_p", [](float* logits, size_t vocab_size, const GenerationConfig& config) {
    ApplyMinP(logits, vocab_size, config.min_p);
  });
}

Status LogitsProcessorRegistry::Register(const std::string& name, LogitsProcessorFunc func) {
  if (IsRegistered(name)) {
    return Status(RET_INVALID_ARGUMENT, fmt::format("Logits processor {} is already registered.", name));
  }

  processors_.emplace_back(name, std::move(func));
  return Status();
}

bool LogitsProcessorRegistry::IsRegistered(const std::string& name) const {
  return std::find_if(processors_.begin(), processors_.end(),
                      [&name](const auto& processor) { return processor.first == name; }) != processors_.end();
}

Status LogitsProcessorRegistry::CheckEnabled(const std::vector<std::string>& enabled_names) const {
  for (const std::string& name : enabled_names) {
    if (!IsRegistered(name)) {
      return Status(RET_INVALID_ARGUMENT, fmt::format("Unknown logits processor {}.", name));
    }
  }
  return Status();
}

Status LogitsProcessorRegistry::Process(float* logits, size_t row_num, size_t vocab_size,
                                        const GenerationConfig& generation_config) const {
  STATUS_CHECK_RETURN(CheckEnabled(generation_config.logits_processors));

  for (const auto& [name, func] : processors_) {
    const std::vector<std::string>& enabled = generation_config.logits_processors;
    if (std::find(enabled.begin(), enabled.end(), name) == enabled.end()) {
      continue;
    }

    RLLM_LOG_DEBUG << fmt::format("Apply logits processor {} on {} rows.", name, row_num);
    for (size_t row = 0; row < row_num; ++row) {
      func(logits + row * vocab_size, vocab_size, generation_config);
    }
  }

  return Status();
}

}  // namespace ripple_llm
