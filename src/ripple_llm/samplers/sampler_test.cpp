/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#include "ripple_llm/samplers/sampler.h"

#include <cmath>
#include <memory>
#include <vector>

#include "ripple_llm/utils/ret_code.h"
#include "test.h"

using namespace ripple_llm;

class SamplerTest : public testing::Test {
 protected:
  void SetUp() override { sampler = std::make_shared<Sampler>(1234); }

  Status Sample(const std::vector<float>& logits, size_t row_num, size_t vocab_size, SamplingResult& result,
                bool is_prefill = false, std::vector<float> cumulative_logprobs = {},
                std::vector<int64_t> group_ids = {}) {
    SamplingRequest sampling_request;
    sampling_request.logits = &logits;
    sampling_request.row_num = row_num;
    sampling_request.vocab_size = vocab_size;
    sampling_request.generation_config = &generation_config;
    sampling_request.cumulative_logprobs = cumulative_logprobs;
    sampling_request.group_ids = group_ids;
    sampling_request.is_prefill = is_prefill;
    return sampler->Sample(sampling_request, result);
  }

  GenerationConfig generation_config;
  std::shared_ptr<Sampler> sampler;
};

// A strategy that always returns the same token.
class ConstantSampling : public BaseSampling {
 private:
  Status RunSampling(const SamplingInput& input, const GenerationConfig& generation_config,
                     SamplingResult& result) override {
    for (size_t row = 0; row < input.row_num; ++row) {
      result.tokens[row] = 1;
    }
    return Status();
  }
};

TEST_F(SamplerTest, StrategyDispatch) {
  GenerationConfig config;
  EXPECT_EQ(Sampler::GetSamplingStrategy(config), SAMPLING_GREEDY);
  config.do_sample = true;
  EXPECT_EQ(Sampler::GetSamplingStrategy(config), SAMPLING_MULTINOMIAL);
  config.num_beams = 3;
  EXPECT_EQ(Sampler::GetSamplingStrategy(config), SAMPLING_BEAM_SEARCH);
  config.do_sample = false;
  EXPECT_EQ(Sampler::GetSamplingStrategy(config), SAMPLING_BEAM_SEARCH);
}

TEST_F(SamplerTest, GreedySampling) {
  std::vector<float> logits = {0.1f, 2.0f, 0.3f, 5.0f, 1.0f, 1.0f};
  SamplingResult result;
  ASSERT_TRUE(Sample(logits, 2, 3, result).OK());
  EXPECT_THAT(result.tokens, testing::ElementsAre(1, 0));
  EXPECT_THAT(result.parent_rows, testing::ElementsAre(0, 1));

  // log_softmax of the picked token.
  float expected = 2.0f - std::log(std::exp(0.1f) + std::exp(2.0f) + std::exp(0.3f));
  EXPECT_NEAR(result.logprobs[0], expected, 1e-5);
}

TEST_F(SamplerTest, StableWithLargeLogits) {
  std::vector<float> logits = {1000.0f, 1001.0f, 999.0f};
  SamplingResult result;
  ASSERT_TRUE(Sample(logits, 1, 3, result).OK());
  EXPECT_EQ(result.tokens[0], 1);
  EXPECT_TRUE(std::isfinite(result.logprobs[0]));
  EXPECT_LT(result.logprobs[0], 0.0f);
}

TEST_F(SamplerTest, MultinomialSampling) {
  generation_config.do_sample = true;
  generation_config.logits_processors = {"top_k"};
  generation_config.top_k = 2;

  std::vector<float> logits = {0.0f, 3.0f, 3.0f, -1.0f};
  std::vector<int> counts(4, 0);
  for (int i = 0; i < 200; ++i) {
    SamplingResult result;
    ASSERT_TRUE(Sample(logits, 1, 4, result).OK());
    ++counts[result.tokens[0]];
  }

  // Only the two kept tokens are drawn, and both of them are.
  EXPECT_EQ(counts[0], 0);
  EXPECT_EQ(counts[3], 0);
  EXPECT_GT(counts[1], 0);
  EXPECT_GT(counts[2], 0);

  // Same seed, same draws.
  Sampler first(7);
  Sampler second(7);
  SamplingRequest sampling_request;
  sampling_request.logits = &logits;
  sampling_request.row_num = 1;
  sampling_request.vocab_size = 4;
  sampling_request.generation_config = &generation_config;
  for (int i = 0; i < 10; ++i) {
    SamplingResult first_result;
    SamplingResult second_result;
    ASSERT_TRUE(first.Sample(sampling_request, first_result).OK());
    ASSERT_TRUE(second.Sample(sampling_request, second_result).OK());
    EXPECT_EQ(first_result.tokens, second_result.tokens);
  }
}

TEST_F(SamplerTest, BeamSearchDecode) {
  generation_config.num_beams = 2;

  // Two groups of two beams. In the first group the second beam is far better, so both survivors continue it.
  // In the second group each beam keeps its own best token.
  std::vector<float> logits = {
      0.0f, 0.0f, 0.0f, 0.0f,   // group 0, row 0
      0.0f, 9.0f, 8.0f, 0.0f,   // group 0, row 1
      5.0f, 0.0f, 0.0f, 0.0f,   // group 1, row 2
      0.0f, 0.0f, 0.0f, 5.0f,   // group 1, row 3
  };
  SamplingResult result;
  ASSERT_TRUE(Sample(logits, 4, 4, result, false, {-5.0f, -0.1f, -1.0f, -1.0f}, {10, 10, 11, 11}).OK());
  EXPECT_THAT(result.tokens, testing::ElementsAre(2, 1, 0, 3));
  EXPECT_THAT(result.parent_rows, testing::ElementsAre(1, 1, 2, 3));
}

TEST_F(SamplerTest, BeamSearchPrefill) {
  generation_config.num_beams = 3;

  std::vector<float> logits(3 * 5, 0.0f);
  logits[4] = 3.0f;
  logits[2] = 2.0f;
  logits[0] = 1.0f;
  SamplingResult result;
  ASSERT_TRUE(Sample(logits, 3, 5, result, true, {0.0f, 0.0f, 0.0f}, {1, 1, 1}).OK());
  EXPECT_THAT(result.tokens, testing::ElementsAre(4, 2, 0));
  EXPECT_THAT(result.parent_rows, testing::ElementsAre(0, 0, 0));
}

TEST_F(SamplerTest, BeamSearchInvalidGroup) {
  generation_config.num_beams = 2;
  std::vector<float> logits(3 * 4, 0.0f);
  SamplingResult result;
  EXPECT_EQ(Sample(logits, 3, 4, result, false, {0.0f, 0.0f, 0.0f}, {1, 1, 1}).GetCode(), RET_INVALID_ARGUMENT);
  EXPECT_EQ(Sample(logits, 3, 4, result, false, {0.0f, 0.0f, 0.0f}, {}).GetCode(), RET_INVALID_ARGUMENT);
}

TEST_F(SamplerTest, InvalidInput) {
  SamplingResult result;
  std::vector<float> logits(6, 0.0f);
  EXPECT_EQ(Sample(logits, 2, 4, result).GetCode(), RET_INVALID_ARGUMENT);
  EXPECT_EQ(Sample(logits, 0, 6, result).GetCode(), RET_INVALID_ARGUMENT);

  std::vector<float> masked(3, -INFINITY);
  EXPECT_EQ(Sample(masked, 1, 3, result).GetCode(), RET_INVALID_ARGUMENT);
}

TEST_F(SamplerTest, RegisterSampling) {
  sampler->RegisterSampling(SAMPLING_GREEDY, std::make_shared<ConstantSampling>());
  std::vector<float> logits = {9.0f, 0.0f, 0.0f};
  SamplingResult result;
  ASSERT_TRUE(Sample(logits, 1, 3, result).OK());
  EXPECT_EQ(result.tokens[0], 1);

  sampler->RegisterSampling(SAMPLING_GREEDY, nullptr);
  EXPECT_EQ(Sample(logits, 1, 3, result).GetCode(), RET_INVALID_ARGUMENT);
}
