/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#include "ripple_llm/samplers/logits_processor.h"

#include <cmath>
#include <string>
#include <vector>

#include "ripple_llm/utils/ret_code.h"
#include "test.h"

namespace ripple_llm {

namespace {

std::vector<bool> GetKeptMask(const std::vector<float>& logits) {
  std::vector<bool> kept;
  for (float logit : logits) {
    kept.push_back(!std::isinf(logit));
  }
  return kept;
}

}  // namespace

TEST(LogitsProcessorTest, TopK) {
  std::vector<float> logits = {1.0f, 4.0f, 3.0f, 2.0f, 3.0f};
  ApplyTopK(logits.data(), logits.size(), 2);
  // The tie of the second value is kept.
  EXPECT_THAT(GetKeptMask(logits), testing::ElementsAre(false, true, true, false, true));

  std::vector<float> untouched = {1.0f, 2.0f};
  ApplyTopK(untouched.data(), untouched.size(), 0);
  ApplyTopK(untouched.data(), untouched.size(), 5);
  EXPECT_THAT(untouched, testing::ElementsAre(1.0f, 2.0f));
}

TEST(LogitsProcessorTest, TopP) {
  // Probabilities are about 0.64, 0.24, 0.09, 0.03.
  std::vector<float> logits = {3.0f, 2.0f, 1.0f, 0.0f};
  std::vector<float> small_p = logits;
  ApplyTopP(small_p.data(), small_p.size(), 0.5f);
  EXPECT_THAT(GetKeptMask(small_p), testing::ElementsAre(true, false, false, false));

  std::vector<float> large_p = logits;
  ApplyTopP(large_p.data(), large_p.size(), 0.8f);
  EXPECT_THAT(GetKeptMask(large_p), testing::ElementsAre(true, true, false, false));

  std::vector<float> all = logits;
  ApplyTopP(all.data(), all.size(), 1.0f);
  EXPECT_EQ(all, logits);
}

TEST(LogitsProcessorTest, MinP) {
  // Probabilities relative to the max are 1, 0.37, 0.14, 0.05.
  std::vector<float> logits = {3.0f, 2.0f, 1.0f, 0.0f};
  ApplyMinP(logits.data(), logits.size(), 0.2f);
  EXPECT_THAT(GetKeptMask(logits), testing::ElementsAre(true, true, false, false));
}

TEST(LogitsProcessorTest, RegistryOrderAndNames) {
  LogitsProcessorRegistry registry;
  EXPECT_TRUE(registry.IsRegistered("top_p"));
  EXPECT_TRUE(registry.IsRegistered("top_k"));
  EXPECT_TRUE(registry.IsRegistered("min_p"));
  EXPECT_FALSE(registry.IsRegistered("temperature"));
  EXPECT_EQ(registry.CheckEnabled({"top_k", "nope"}).GetCode(), RET_INVALID_ARGUMENT);

  std::vector<std::string> applied;
  ASSERT_TRUE(registry
                  .Register("temperature",
                            [&applied](float* logits, size_t vocab_size, const GenerationConfig&) {
                              applied.push_back("temperature");
                            })
                  .OK());
  EXPECT_EQ(registry.Register("top_k", nullptr).GetCode(), RET_INVALID_ARGUMENT);

  // top_k runs before min_p no matter how they are listed.
  GenerationConfig generation_config;
  generation_config.logits_processors = {"temperature", "min_p", "top_k"};
  generation_config.top_k = 1;
  generation_config.min_p = 0.5f;

  std::vector<float> logits = {1.0f, 3.0f, 2.9f, 0.0f, 5.0f, 4.9f, 2.0f, 1.0f};
  ASSERT_TRUE(registry.Process(logits.data(), 2, 4, generation_config).OK());
  EXPECT_THAT(GetKeptMask(logits), testing::ElementsAre(false, true, false, false, true, false, false, false));
  EXPECT_THAT(applied, testing::ElementsAre("temperature", "temperature"));

  // Disabled processors are skipped.
  generation_config.logits_processors.clear();
  std::vector<float> untouched = {1.0f, 2.0f};
  ASSERT_TRUE(registry.Process(untouched.data(), 1, 2, generation_config).OK());
  EXPECT_THAT(untouched, testing::ElementsAre(1.0f, 2.0f));
}

}  // namespace ripple_llm
