/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include "tests/test.h"

#include "ripple_llm/utils/logger.h"

// Initialize the logger once for the whole test process.
class LoguruEnvironment : public testing::Environment {
 public:
  virtual ~LoguruEnvironment() = default;

  virtual void SetUp() { ripple_llm::InitLoguru(); }
};

int main(int argc, char** argv) {
  LoguruEnvironment* env = new LoguruEnvironment();
  testing::AddGlobalTestEnvironment(env);
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
