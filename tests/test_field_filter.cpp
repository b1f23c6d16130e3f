// ---------------------------------------------------------------------------
// test_field_filter.cpp
//
// 필드 권한 계산 / 레코드 필드 필터링 단위 테스트.
// ---------------------------------------------------------------------------

#include "policy/field_filter.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

using Names = std::vector<std::string>;

const Value kRecord = Value::object({
    {"id", "t1"},
    {"title", "Night Drive"},
    {"ownerId", "user-123"},
    {"internalNotes", "pending review"},
});

}  // namespace

// ===========================================================================
// filter_fields
// ===========================================================================

TEST(FieldFilter, Defaults_AllFieldsWhenUndeclared) {
    const AllowedFields fields = filter_fields(FieldSpec{});
    EXPECT_EQ(fields.read, Names{"*"});
    EXPECT_EQ(fields.write, Names{"*"});
    EXPECT_TRUE(fields.denied.empty());
}

TEST(FieldFilter, Deny_RemovedFromDeclaredLists) {
    FieldSpec spec;
    spec.read  = Names{"id", "title", "internalNotes"};
    spec.write = Names{"title", "internalNotes"};
    spec.deny  = Names{"internalNotes"};

    const AllowedFields fields = filter_fields(spec);
    EXPECT_EQ(fields.read, (Names{"id", "title"}));
    EXPECT_EQ(fields.write, Names{"title"});
    EXPECT_EQ(fields.denied, Names{"internalNotes"});
}

TEST(FieldFilter, Deny_KeepsWildcardAndReportsDenied) {
    FieldSpec spec;
    spec.read = Names{"*"};
    spec.deny = Names{"internalNotes"};

    const AllowedFields fields = filter_fields(spec);
    EXPECT_EQ(fields.read, Names{"*"});
    EXPECT_EQ(fields.write, Names{"*"});
    EXPECT_EQ(fields.denied, Names{"internalNotes"});
}

TEST(FieldFilter, EmptyDeclaredListAllowsNothing) {
    FieldSpec spec;
    spec.write = Names{};
    EXPECT_TRUE(filter_fields(spec).write.empty());
}

TEST(FieldFilter, OrderPreserved) {
    FieldSpec spec;
    spec.read = Names{"title", "id", "ownerId"};
    EXPECT_EQ(filter_fields(spec).read, (Names{"title", "id", "ownerId"}));
}

// ===========================================================================
// filter_data_fields
// ===========================================================================

TEST(FilterDataFields, KeepsOnlyAllowedKeys) {
    const Value out = filter_data_fields(kRecord, Names{"id", "title", "missing"});
    EXPECT_EQ(out.to_json(), R"({"id":"t1","title":"Night Drive"})");
}

TEST(FilterDataFields, WildcardPassesThrough) {
    EXPECT_EQ(filter_data_fields(kRecord, Names{"*"}), kRecord);
}

TEST(FilterDataFields, NonObjectBecomesEmptyObject) {
    EXPECT_EQ(filter_data_fields(Value{"text"}, Names{"*"}).to_json(), "{}");
    EXPECT_EQ(filter_data_fields(Value{}, Names{"id"}).to_json(), "{}");
    EXPECT_EQ(filter_data_fields(Value::array({1}), Names{"*"}).to_json(), "{}");
}

TEST(FilterDataFields, EmptyAllowListRemovesEverything) {
    EXPECT_EQ(filter_data_fields(kRecord, Names{}).to_json(), "{}");
}

TEST(FilterDataFields, WildcardWithDenyRemovesDenied) {
    const AllowedFields fields{Names{"*"}, Names{"title"}, Names{"internalNotes"}};
    const Value read = filter_data_fields(kRecord, fields, FieldMode::kRead);
    EXPECT_EQ(read.to_json(), R"({"id":"t1","ownerId":"user-123","title":"Night Drive"})");

    const Value write = filter_data_fields(kRecord, fields, FieldMode::kWrite);
    EXPECT_EQ(write.to_json(), R"({"title":"Night Drive"})");
}

TEST(FilterDataFields, InputUnchanged) {
    const Value before = kRecord;
    (void)filter_data_fields(kRecord, Names{"id"});
    EXPECT_EQ(kRecord, before);
}
