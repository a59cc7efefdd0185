#include <gtest/gtest.h>

#include "runtime/resource/store/record_codec.h"

#include <cmath>

namespace docket {
namespace test {

namespace {

TaskRecord completedRecord() {
    TaskRecord record = TaskRecord::makePending(*TaskId::fromString("0b9c3c1e-5d2a-4f6b-9c8d-1a2b3c4d5e6f"),
                                                1700000000.25);
    markProcessing(record, 1700000000.5);

    Json::Value result(Json::objectValue);
    result["n"] = 42;
    result["tags"].append("a");
    result["tags"].append("b");
    markCompleted(record, result, 1700000001.75);
    return record;
}

FieldMap toMap(const FieldList& fields) {
    return FieldMap(fields.begin(), fields.end());
}

} // namespace

TEST(RecordCodecTest, JsonShapeOfCompletedRecord) {
    Json::Value json = toJson(completedRecord());

    EXPECT_EQ(json["id"].asString(), "0b9c3c1e-5d2a-4f6b-9c8d-1a2b3c4d5e6f");
    EXPECT_EQ(json["status"].asString(), "completed");
    EXPECT_DOUBLE_EQ(json["created_at"].asDouble(), 1700000000.25);
    EXPECT_DOUBLE_EQ(json["updated_at"].asDouble(), 1700000001.75);
    EXPECT_EQ(json["result"]["n"].asInt(), 42);
    EXPECT_FALSE(json.isMember("error"));
}

TEST(RecordCodecTest, JsonOmitsAbsentResultAndError) {
    TaskRecord pending = TaskRecord::makePending(TaskId::generate(), 10.0);
    Json::Value json = toJson(pending);

    EXPECT_EQ(json["status"].asString(), "pending");
    EXPECT_FALSE(json.isMember("result"));
    EXPECT_FALSE(json.isMember("error"));
}

TEST(RecordCodecTest, JsonOfFailedRecordCarriesError) {
    TaskRecord failed = TaskRecord::makePending(TaskId::generate(), 10.0);
    markFailed(failed, "boom", 11.0);
    Json::Value json = toJson(failed);

    EXPECT_EQ(json["status"].asString(), "failed");
    EXPECT_EQ(json["error"].asString(), "boom");
    EXPECT_FALSE(json.isMember("result"));

    auto decoded = fromJson(json);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->error, "boom");
}

TEST(RecordCodecTest, FromJsonRejectsBrokenShapes) {
    Json::Value json = toJson(completedRecord());

    Json::Value badStatus = json;
    badStatus["status"] = "done";
    EXPECT_FALSE(fromJson(badStatus).has_value());

    Json::Value badId = json;
    badId["id"] = 7;
    EXPECT_FALSE(fromJson(badId).has_value());

    Json::Value missingResult = json;
    missingResult.removeMember("result");
    EXPECT_FALSE(fromJson(missingResult).has_value());

    EXPECT_FALSE(fromJson(Json::Value("not an object")).has_value());
}

TEST(RecordCodecTest, FieldsHoldOneTextValuePerRecordField) {
    FieldMap fields = toMap(toFields(completedRecord()));

    EXPECT_EQ(fields.size(), 5u);
    EXPECT_EQ(fields.at("id"), "0b9c3c1e-5d2a-4f6b-9c8d-1a2b3c4d5e6f");
    EXPECT_EQ(fields.at("status"), "completed");
    EXPECT_EQ(fields.at("created_at"), "1700000000.250000");
    EXPECT_EQ(fields.at("updated_at"), "1700000001.750000");
    EXPECT_EQ(fields.count("error"), 0u);

    auto result = parseJson(fields.at("result"));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["n"].asInt(), 42);
    EXPECT_EQ((*result)["tags"].size(), 2u);
}

TEST(RecordCodecTest, FieldsDecodeToTheSameRecord) {
    TaskRecord original = completedRecord();
    auto decoded = fromFields(toMap(toFields(original)));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->id, original.id);
    EXPECT_EQ(decoded->status, original.status);
    EXPECT_DOUBLE_EQ(decoded->createdAt, original.createdAt);
    EXPECT_DOUBLE_EQ(decoded->updatedAt, original.updatedAt);
    EXPECT_EQ(decoded->result, original.result);
    EXPECT_FALSE(decoded->error.has_value());
}

TEST(RecordCodecTest, FromFieldsRejectsCorruptHashes) {
    FieldMap fields = toMap(toFields(completedRecord()));

    FieldMap missingStatus = fields;
    missingStatus.erase("status");
    EXPECT_FALSE(fromFields(missingStatus).has_value());

    FieldMap badTimestamp = fields;
    badTimestamp["created_at"] = "yesterday";
    EXPECT_FALSE(fromFields(badTimestamp).has_value());

    FieldMap badResult = fields;
    badResult["result"] = "{\"n\":";
    EXPECT_FALSE(fromFields(badResult).has_value());

    FieldMap errorOnCompleted = fields;
    errorOnCompleted["error"] = "boom";
    EXPECT_FALSE(fromFields(errorOnCompleted).has_value());

    EXPECT_FALSE(fromFields(FieldMap{}).has_value());
}

TEST(RecordCodecTest, TimestampText) {
    EXPECT_EQ(formatTimestamp(1.5), "1.500000");
    EXPECT_EQ(parseTimestamp("1700000000.123456"), 1700000000.123456);
    EXPECT_FALSE(parseTimestamp("").has_value());
    EXPECT_FALSE(parseTimestamp("12abc").has_value());
    EXPECT_FALSE(parseTimestamp("nan").has_value());
}

TEST(RecordCodecTest, JsonTextIsCompact) {
    Json::Value value(Json::objectValue);
    value["n"] = 42;
    EXPECT_EQ(writeJson(value), "{\"n\":42}");

    std::string errors;
    EXPECT_FALSE(parseJson("{oops", &errors).has_value());
    EXPECT_FALSE(errors.empty());
}

} // namespace test
} // namespace docket
