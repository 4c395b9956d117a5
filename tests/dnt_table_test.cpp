/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dnt/dnt_error.h"
#include "dnt/dnt_table.h"
#include "dnt_test_util.h"

#include <gtest/gtest.h>

#include <limits>

using namespace dntkit::dnt;

TEST(Table, EmptyTableHoldsOnlyTheIdColumn) {
    const Table table = make_empty_table();
    ASSERT_EQ(table.head.size(), 1u);
    EXPECT_EQ(table.head[0].name, "id");
    EXPECT_EQ(table.head[0].type, ValueType::Int32);
    EXPECT_EQ(table.head[0].raw_tag, 3);
    EXPECT_TRUE(is_id_column(table.head[0]));
    EXPECT_TRUE(table.body.empty());
}

TEST(Table, MakeColumnResolvesTag) {
    const Column c = make_column("speed", 4);
    EXPECT_EQ(c.name, "speed");
    EXPECT_EQ(c.type, ValueType::Float32);
    EXPECT_EQ(c.raw_tag, 4);
    EXPECT_THROW(make_column("bad", 9), UnknownTypeTagError);
}

TEST(Table, ValueTypeOfActiveVariant) {
    EXPECT_EQ(value_type_of(Value{std::string("x")}), ValueType::Text);
    EXPECT_EQ(value_type_of(Value{std::int32_t{5}}), ValueType::Int32);
    EXPECT_EQ(value_type_of(Value{1.5f}), ValueType::Float32);
}

TEST(Table, FloatsCompareByBitPattern) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    EXPECT_TRUE(values_identical(Value{nan}, Value{nan}));
    EXPECT_FALSE(values_identical(Value{0.0f}, Value{-0.0f}));
    EXPECT_FALSE(values_identical(Value{std::int32_t{1}}, Value{1.0f}));
    EXPECT_TRUE(values_identical(Value{std::string("a")}, Value{std::string("a")}));
}

TEST(Table, EqualityIncludesRawTag) {
    Table a = make_empty_table();
    a.head.push_back(make_column("n", 2));
    Table b = make_empty_table();
    b.head.push_back(make_column("n", 3));
    EXPECT_FALSE(a == b);
    b.head[1].raw_tag = 2;
    EXPECT_TRUE(a == b);
}

TEST(Table, ListsDuplicateColumnNamesOnce) {
    Table table = make_empty_table();
    EXPECT_TRUE(duplicate_column_names(table).empty());

    table.head.push_back(make_column("dup", 1));
    table.head.push_back(make_column("x", 3));
    table.head.push_back(make_column("dup", 5));
    table.head.push_back(make_column("id", 2));
    table.head.push_back(make_column("dup", 4));
    const auto dups = duplicate_column_names(table);
    ASSERT_EQ(dups.size(), 2u);
    EXPECT_EQ(dups[0], "id");
    EXPECT_EQ(dups[1], "dup");
}

TEST(TableValidation, AcceptsWellFormedTable) {
    EXPECT_NO_THROW(validate_table(test::make_sample_table()));
    EXPECT_NO_THROW(validate_table(make_empty_table()));
}

TEST(TableValidation, RejectsEmptyHeader) {
    EXPECT_THROW(validate_table(Table{}), ContractViolation);
}

TEST(TableValidation, RejectsMissingIdColumn) {
    Table table{};
    table.head.push_back(make_column("name", 1));
    EXPECT_THROW(validate_table(table), ContractViolation);

    Table renamed = make_empty_table();
    renamed.head[0].name = "key";
    EXPECT_THROW(validate_table(renamed), ContractViolation);

    Table retagged = make_empty_table();
    retagged.head[0].raw_tag = 2;
    EXPECT_THROW(validate_table(retagged), ContractViolation);
}

TEST(TableValidation, RejectsTagThatDisagreesWithType) {
    Table table = make_empty_table();
    table.head.push_back(Column{"label", ValueType::Text, 3});
    EXPECT_THROW(validate_table(table), ContractViolation);

    table.head[1].raw_tag = 0;
    EXPECT_THROW(validate_table(table), ContractViolation);
}

TEST(TableValidation, RejectsRowShapeMismatch) {
    Table table = make_empty_table();
    table.head.push_back(make_column("label", 1));
    table.body.push_back(Row{{std::int32_t{1}}});
    EXPECT_THROW(validate_table(table), ContractViolation);

    table.body[0].values.push_back(std::string("ok"));
    EXPECT_NO_THROW(validate_table(table));

    table.body[0].values.push_back(std::string("extra"));
    EXPECT_THROW(validate_table(table), ContractViolation);
}

TEST(TableValidation, RejectsWrongVariant) {
    Table table = make_empty_table();
    table.head.push_back(make_column("count", 3));
    table.body.push_back(Row{{std::int32_t{1}, 2.0f}});
    try {
        validate_table(table);
        FAIL() << "float accepted in Int32 column";
    } catch (const ContractViolation& e) {
        EXPECT_EQ(e.code(), ErrorCode::ContractViolation);
        EXPECT_NE(std::string(e.what()).find("count"), std::string::npos);
    }
}

TEST(TableValidation, RejectsOversizedStrings) {
    Table table = make_empty_table();
    table.head.push_back(make_column("label", 1));
    table.body.push_back(Row{{std::int32_t{1}, std::string(65536, 'x')}});
    EXPECT_THROW(validate_table(table), ContractViolation);

    table.body[0].values[1] = std::string(65535, 'x');
    EXPECT_NO_THROW(validate_table(table));

    table.head[1].name = std::string(65536, 'n');
    EXPECT_THROW(validate_table(table), ContractViolation);
}
