#include <gtest/gtest.h>

#include "runtime/resource/core/task_record.h"

namespace docket {
namespace test {

class TaskRecordTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_record = TaskRecord::makePending(TaskId::generate(), 1000.0);
    }

    TaskRecord m_record;
};

TEST(TaskStatusTest, NamesMatchExternalShape) {
    EXPECT_STREQ(toString(TaskStatus::Pending), "pending");
    EXPECT_STREQ(toString(TaskStatus::Processing), "processing");
    EXPECT_STREQ(toString(TaskStatus::Completed), "completed");
    EXPECT_STREQ(toString(TaskStatus::Failed), "failed");

    EXPECT_EQ(parseTaskStatus("completed"), TaskStatus::Completed);
    EXPECT_FALSE(parseTaskStatus("done").has_value());
    EXPECT_FALSE(parseTaskStatus("PENDING").has_value());
}

TEST(TaskStatusTest, OnlyCompletedAndFailedAreTerminal) {
    EXPECT_FALSE(isTerminal(TaskStatus::Pending));
    EXPECT_FALSE(isTerminal(TaskStatus::Processing));
    EXPECT_TRUE(isTerminal(TaskStatus::Completed));
    EXPECT_TRUE(isTerminal(TaskStatus::Failed));
}

TEST(TaskStatusTest, NowSecondsIsWallClock) {
    const double now = nowSeconds();
    // 2020-01-01 as a sanity floor
    EXPECT_GT(now, 1577836800.0);
}

TEST_F(TaskRecordTest, PendingRecordIsConsistent) {
    EXPECT_EQ(m_record.status, TaskStatus::Pending);
    EXPECT_DOUBLE_EQ(m_record.createdAt, 1000.0);
    EXPECT_DOUBLE_EQ(m_record.updatedAt, 1000.0);
    EXPECT_FALSE(m_record.result.has_value());
    EXPECT_FALSE(m_record.error.has_value());
    EXPECT_TRUE(isConsistent(m_record));
}

TEST_F(TaskRecordTest, SuccessPath) {
    TaskRecord before = m_record;
    markProcessing(m_record, 1001.0);
    EXPECT_TRUE(isValidTransition(before, m_record));
    EXPECT_EQ(m_record.status, TaskStatus::Processing);
    EXPECT_DOUBLE_EQ(m_record.updatedAt, 1001.0);

    before = m_record;
    Json::Value result(Json::objectValue);
    result["n"] = 42;
    markCompleted(m_record, result, 1002.0);
    EXPECT_TRUE(isValidTransition(before, m_record));
    EXPECT_EQ(m_record.status, TaskStatus::Completed);
    ASSERT_TRUE(m_record.result.has_value());
    EXPECT_EQ((*m_record.result)["n"].asInt(), 42);
    EXPECT_FALSE(m_record.error.has_value());
}

TEST_F(TaskRecordTest, FailurePath) {
    markProcessing(m_record, 1001.0);
    TaskRecord before = m_record;
    markFailed(m_record, "boom", 1002.0);

    EXPECT_TRUE(isValidTransition(before, m_record));
    EXPECT_EQ(m_record.status, TaskStatus::Failed);
    EXPECT_EQ(m_record.error, "boom");
    EXPECT_FALSE(m_record.result.has_value());
}

TEST_F(TaskRecordTest, PendingMayFailDirectly) {
    TaskRecord before = m_record;
    markFailed(m_record, "task queue is shut down", 1000.5);
    EXPECT_TRUE(isValidTransition(before, m_record));
}

TEST_F(TaskRecordTest, EmptyErrorBecomesUnknownError) {
    markFailed(m_record, "", 1001.0);
    EXPECT_EQ(m_record.error, "unknown error");
    EXPECT_TRUE(isConsistent(m_record));
}

TEST_F(TaskRecordTest, UpdatedAtNeverMovesBackwards) {
    markProcessing(m_record, 1005.0);
    markCompleted(m_record, Json::Value(1), 1003.0);
    EXPECT_DOUBLE_EQ(m_record.updatedAt, 1005.0);

    TaskRecord fresh = TaskRecord::makePending(TaskId::generate(), 2000.0);
    markProcessing(fresh, 1500.0);
    EXPECT_DOUBLE_EQ(fresh.updatedAt, 2000.0);
    EXPECT_LE(fresh.createdAt, fresh.updatedAt);
}

TEST_F(TaskRecordTest, TerminalStatesAreFinal) {
    markProcessing(m_record, 1001.0);
    markCompleted(m_record, Json::Value("done"), 1002.0);

    TaskRecord failedAfterwards = m_record;
    markFailed(failedAfterwards, "late", 1003.0);
    EXPECT_FALSE(isValidTransition(m_record, failedAfterwards));

    TaskRecord rerun = m_record;
    markProcessing(rerun, 1003.0);
    EXPECT_FALSE(isValidTransition(m_record, rerun));

    TaskRecord newResult = m_record;
    newResult.result = Json::Value("other");
    EXPECT_FALSE(isValidTransition(m_record, newResult));
}

TEST_F(TaskRecordTest, StatusNeverRegresses) {
    markProcessing(m_record, 1001.0);
    TaskRecord back = m_record;
    back.status = TaskStatus::Pending;
    back.updatedAt = 1002.0;
    EXPECT_FALSE(isValidTransition(m_record, back));
}

TEST_F(TaskRecordTest, IdentityFieldsAreImmutable) {
    TaskRecord otherId = m_record;
    otherId.id = TaskId::generate();
    EXPECT_FALSE(isValidTransition(m_record, otherId));

    TaskRecord otherCreated = m_record;
    otherCreated.createdAt = 999.0;
    EXPECT_FALSE(isValidTransition(m_record, otherCreated));

    TaskRecord earlier = m_record;
    earlier.updatedAt = 999.5;
    EXPECT_FALSE(isValidTransition(m_record, earlier));
}

TEST_F(TaskRecordTest, InconsistentRecordsAreRejected) {
    TaskRecord resultWhilePending = m_record;
    resultWhilePending.result = Json::Value(1);
    EXPECT_FALSE(isConsistent(resultWhilePending));
    EXPECT_FALSE(isValidTransition(m_record, resultWhilePending));

    TaskRecord completedWithoutResult = m_record;
    completedWithoutResult.status = TaskStatus::Completed;
    EXPECT_FALSE(isConsistent(completedWithoutResult));

    TaskRecord failedWithEmptyError = m_record;
    failedWithEmptyError.status = TaskStatus::Failed;
    failedWithEmptyError.error = "";
    EXPECT_FALSE(isConsistent(failedWithEmptyError));

    TaskRecord noId;
    EXPECT_FALSE(isConsistent(noId));
}

TEST_F(TaskRecordTest, StalenessOnlyAppliesToProcessing) {
    EXPECT_FALSE(m_record.isStale(10.0, 2000.0));

    markProcessing(m_record, 1000.0);
    EXPECT_FALSE(m_record.isStale(10.0, 1005.0));
    EXPECT_FALSE(m_record.isStale(10.0, 1010.0));
    EXPECT_TRUE(m_record.isStale(10.0, 1010.5));

    markCompleted(m_record, Json::Value(), 1001.0);
    EXPECT_FALSE(m_record.isStale(10.0, 5000.0));
}

TEST_F(TaskRecordTest, AgeIsMeasuredFromCreation) {
    markProcessing(m_record, 1500.0);
    EXPECT_DOUBLE_EQ(m_record.age(1600.0), 600.0);
}

} // namespace test
} // namespace docket
