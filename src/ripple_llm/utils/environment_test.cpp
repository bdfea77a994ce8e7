/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "ripple_llm/utils/environment.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "ripple_llm/utils/yaml_reader.h"
#include "test.h"

using namespace ripple_llm;

class EnvironmentTest : public testing::Test {
 protected:
  void SetUp() override { config_file = testing::TempDir() + "ripple_llm_environment_test.yaml"; }

  void TearDown() override { std::remove(config_file.c_str()); }

  void WriteConfig(const std::string& content) {
    std::ofstream file(config_file);
    file << content;
  }

  std::string config_file;
};

TEST_F(EnvironmentTest, ParseFullConfig) {
  WriteConfig(R"(
setting:
  request_handler:
    max_input_len: 100
    ratio: 0.5
    bucket_num: 4
  cache_manager:
    block_num: 64
    block_token_num: 8
    max_blocks_per_sequence: 20
  generation:
    eos_id: 7
    max_output_len: 50
    num_beams: 2
    do_sample: true
    logits_processors: [min_p, top_k]
    top_k: 5
    top_p: 0.9
    min_p: 0.1
    seed: 42
)");

  Environment env;
  ASSERT_TRUE(env.ParseConfig(config_file).OK());

  RequestHandlerConfig request_handler_config;
  CacheManagerConfig cache_manager_config;
  GenerationConfig generation_config;
  EXPECT_TRUE(env.GetRequestHandlerConfig(request_handler_config).OK());
  EXPECT_TRUE(env.GetCacheManagerConfig(cache_manager_config).OK());
  EXPECT_TRUE(env.GetGenerationConfig(generation_config).OK());

  EXPECT_EQ(request_handler_config.max_input_len, 100);
  EXPECT_FLOAT_EQ(request_handler_config.ratio, 0.5f);
  EXPECT_EQ(request_handler_config.waiting_bucket_num, 4);
  EXPECT_EQ(cache_manager_config.block_num, 64);
  EXPECT_EQ(cache_manager_config.block_token_num, 8);
  EXPECT_EQ(cache_manager_config.max_blocks_per_sequence, 20);
  EXPECT_EQ(generation_config.eos_id, 7);
  EXPECT_EQ(generation_config.max_output_len, 50);
  EXPECT_EQ(generation_config.num_beams, 2);
  EXPECT_TRUE(generation_config.do_sample);
  EXPECT_THAT(generation_config.logits_processors, testing::ElementsAre("min_p", "top_k"));
  EXPECT_EQ(generation_config.top_k, 5);
  EXPECT_FLOAT_EQ(generation_config.top_p, 0.9f);
  EXPECT_FLOAT_EQ(generation_config.min_p, 0.1f);
  EXPECT_EQ(generation_config.seed, 42);
}

TEST_F(EnvironmentTest, DefaultsAndDerivedBlocks) {
  WriteConfig(R"(
setting:
  request_handler:
    max_input_len: 30
  generation:
    max_output_len: 20
)");

  Environment env;
  ASSERT_TRUE(env.ParseConfig(config_file).OK());

  RequestHandlerConfig request_handler_config;
  CacheManagerConfig cache_manager_config;
  GenerationConfig generation_config;
  EXPECT_TRUE(env.GetRequestHandlerConfig(request_handler_config).OK());
  EXPECT_TRUE(env.GetCacheManagerConfig(cache_manager_config).OK());
  EXPECT_TRUE(env.GetGenerationConfig(generation_config).OK());

  EXPECT_FLOAT_EQ(request_handler_config.ratio, 1.2f);
  EXPECT_EQ(request_handler_config.waiting_bucket_num, 3);
  EXPECT_EQ(cache_manager_config.block_num, 512);
  EXPECT_EQ(cache_manager_config.block_token_num, 16);

  // ceil((30 + 20) / 16)
  EXPECT_EQ(cache_manager_config.max_blocks_per_sequence, 4);
  EXPECT_EQ(generation_config.num_beams, 1);
  EXPECT_FALSE(generation_config.do_sample);
  EXPECT_TRUE(generation_config.logits_processors.empty());
}

TEST_F(EnvironmentTest, InvalidConfig) {
  Environment env;
  EXPECT_EQ(env.ParseConfig(config_file + ".not_exist").GetCode(), RET_INVALID_ARGUMENT);

  WriteConfig("setting:\n  request_handler:\n    ratio: -1.0\n");
  EXPECT_EQ(env.ParseConfig(config_file).GetCode(), RET_INVALID_ARGUMENT);

  WriteConfig("setting:\n  cache_manager:\n    block_num: 0\n");
  EXPECT_EQ(env.ParseConfig(config_file).GetCode(), RET_INVALID_ARGUMENT);

  WriteConfig("setting:\n  generation:\n    num_beams: 0\n");
  EXPECT_EQ(env.ParseConfig(config_file).GetCode(), RET_INVALID_ARGUMENT);

  WriteConfig("just a scalar");
  EXPECT_EQ(env.ParseConfig(config_file).GetCode(), RET_INVALID_ARGUMENT);
}

TEST_F(EnvironmentTest, BlocksTooFewForMaxInput) {
  // 5 blocks of 4 tokens could never hold a 99 token prompt.
  WriteConfig(R"(
setting:
  request_handler:
    max_input_len: 100
  cache_manager:
    block_token_num: 4
    max_blocks_per_sequence: 5
)");
  Environment env;
  EXPECT_EQ(env.ParseConfig(config_file).GetCode(), RET_INVALID_ARGUMENT);

  WriteConfig(R"(
setting:
  request_handler:
    max_input_len: 100
  cache_manager:
    block_token_num: 4
    max_blocks_per_sequence: 25
)");
  ASSERT_TRUE(env.ParseConfig(config_file).OK());
  CacheManagerConfig cache_manager_config;
  EXPECT_TRUE(env.GetCacheManagerConfig(cache_manager_config).OK());
  EXPECT_EQ(cache_manager_config.max_blocks_per_sequence, 25);
}

TEST_F(EnvironmentTest, InvalidValueType) {
  Environment env;
  WriteConfig("setting:\n  request_handler:\n    max_input_len: many\n");
  EXPECT_EQ(env.ParseConfig(config_file).GetCode(), RET_INVALID_ARGUMENT);

  WriteConfig("setting:\n  cache_manager:\n    block_num: [1, 2]\n");
  EXPECT_EQ(env.ParseConfig(config_file).GetCode(), RET_INVALID_ARGUMENT);

  WriteConfig("setting:\n  generation:\n    logits_processors: {top_k: 1}\n");
  EXPECT_EQ(env.ParseConfig(config_file).GetCode(), RET_INVALID_ARGUMENT);
}

TEST_F(EnvironmentTest, YamlReaderDomain) {
  WriteConfig("a:\n  b:\n    c: 3\n    list: [1, 2]\n    one: 5\n");

  YamlReader yaml_reader;
  ASSERT_TRUE(yaml_reader.LoadFile(config_file).OK());

  int value = 9;
  EXPECT_TRUE(yaml_reader.GetScalar("a.b.c", value).OK());
  EXPECT_EQ(value, 3);

  // Missing keys keep the default.
  value = 9;
  EXPECT_TRUE(yaml_reader.GetScalar("a.b.missing", value).OK());
  EXPECT_TRUE(yaml_reader.GetScalar("a.c.b", value).OK());
  EXPECT_TRUE(yaml_reader.GetScalar("a.b.c.d", value).OK());
  EXPECT_EQ(value, 9);

  // Lookups never change the document.
  EXPECT_TRUE(yaml_reader.GetScalar("a.b.c", value).OK());
  EXPECT_EQ(value, 3);

  std::vector<int> values;
  EXPECT_TRUE(yaml_reader.GetScalarList("a.b.list", values).OK());
  EXPECT_THAT(values, testing::ElementsAre(1, 2));
  EXPECT_TRUE(yaml_reader.GetScalarList("a.b.one", values).OK());
  EXPECT_THAT(values, testing::ElementsAre(5));

  EXPECT_EQ(yaml_reader.GetScalar("a.b", value).GetCode(), RET_INVALID_ARGUMENT);
  EXPECT_EQ(yaml_reader.GetScalar("a.b.list", value).GetCode(), RET_INVALID_ARGUMENT);
}
