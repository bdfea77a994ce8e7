/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/
#include "ripple_llm/batch_scheduler/batch_info.h"

#include <memory>
#include <vector>

#include "ripple_llm/utils/ret_code.h"
#include "test.h"

using namespace ripple_llm;

namespace {

std::shared_ptr<Sequence> MakeSequence(int64_t req_id, int64_t group_id = -1) {
  return std::make_shared<Sequence>(req_id, std::vector<int>(4, 1), group_id);
}

}  // namespace

TEST(BatchInfoTest, AddRemove) {
  BatchInfo batch(false);
  EXPECT_TRUE(batch.IsEmpty());
  EXPECT_FALSE(batch.IsPrompts());

  ASSERT_TRUE(batch.AddSeq(MakeSequence(1)).OK());
  ASSERT_TRUE(batch.AddSeq(MakeSequence(2)).OK());
  EXPECT_EQ(batch.AddSeq(MakeSequence(1)).GetCode(), RET_INVARIANT_VIOLATION);
  EXPECT_THAT(batch.GetReqIds(), testing::ElementsAre(1, 2));

  EXPECT_TRUE(batch.Remove(1));
  EXPECT_FALSE(batch.Remove(1));
  EXPECT_FALSE(batch.Contains(1));
  EXPECT_TRUE(batch.Contains(2));

  batch.Clear();
  EXPECT_TRUE(batch.IsEmpty());
}

TEST(BatchInfoTest, GroupMembersStayAdjacent) {
  BatchInfo batch(false);
  ASSERT_TRUE(batch.AddSeq(MakeSequence(1, 100)).OK());
  ASSERT_TRUE(batch.AddSeq(MakeSequence(2, 200)).OK());
  ASSERT_TRUE(batch.AddSeq(MakeSequence(3, 100)).OK());
  ASSERT_TRUE(batch.AddSeq(MakeSequence(4, 300)).OK());
  ASSERT_TRUE(batch.AddSeq(MakeSequence(5, 200)).OK());
  ASSERT_TRUE(batch.AddSeq(MakeSequence(6, 100)).OK());
  EXPECT_THAT(batch.GetReqIds(), testing::ElementsAre(1, 3, 6, 2, 5, 4));

  // Removing a member in the middle keeps the others together.
  EXPECT_TRUE(batch.Remove(3));
  ASSERT_TRUE(batch.AddSeq(MakeSequence(7, 200)).OK());
  EXPECT_THAT(batch.GetReqIds(), testing::ElementsAre(1, 6, 2, 5, 7, 4));
}
