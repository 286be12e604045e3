// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>
#include <pgbind/bind/template.h>

using namespace pgbind;

class TemplateTest : public ::testing::Test {
protected:
    NamedArgs vars_{
        {"table", Value("items")},
        {"name", Value("O'Brien")},
        {"col", Value("my \"col\"")},
        {"n", Value(10)},
        {"tags", Value(Value::StringList{"a", "b'c"})},
        {"ids", Value(Value::List{Scalar{int64_t{1}}, Scalar{int64_t{2}}})},
    };
};

TEST_F(TemplateTest, PlainTextUnchanged) {
    EXPECT_EQ(substitute("SELECT 1", vars_), "SELECT 1");
    EXPECT_EQ(substitute("", vars_), "");
}

TEST_F(TemplateTest, UnquotedExpansion) {
    EXPECT_EQ(substitute("SELECT * FROM ${table} LIMIT ${n}", vars_),
              "SELECT * FROM items LIMIT 10");
}

TEST_F(TemplateTest, QuotedExpansion) {
    EXPECT_EQ(substitute("WHERE name = ${'name'}", vars_), "WHERE name = 'O''Brien'");
    EXPECT_EQ(substitute("SELECT ${\"col\"}", vars_), "SELECT \"my \"\"col\"\"\"");
}

TEST_F(TemplateTest, QuotedSequenceExpandsToList) {
    EXPECT_EQ(substitute("tag IN (${'tags'})", vars_), "tag IN ('a','b''c')");
    EXPECT_EQ(substitute("id IN (${'ids'})", vars_), "id IN ('1','2')");
    EXPECT_EQ(substitute("${tags}", vars_), "a,b'c");
}

TEST_F(TemplateTest, UnsetKeysRenderEmpty) {
    EXPECT_EQ(substitute("[${missing}]", vars_), "[]");
    EXPECT_EQ(substitute("[${'missing'}]", vars_), "['']");
    EXPECT_EQ(substitute("[${\"missing\"}]", vars_), "[\"\"]");
}

TEST_F(TemplateTest, DollarMarkers) {
    EXPECT_EQ(substitute("$$body$$", vars_), "$$body$$");
    EXPECT_EQ(substitute("${$}", vars_), "$$");
    EXPECT_EQ(substitute("WHERE id = $1 AND x = $23", vars_), "WHERE id = $1 AND x = $23");
    EXPECT_EQ(substitute("${2}", vars_), "$2");
}

TEST_F(TemplateTest, OtherDollarsCopiedThrough) {
    EXPECT_EQ(substitute("$name", vars_), "$name");
    EXPECT_EQ(substitute("cost $", vars_), "cost $");
    EXPECT_EQ(substitute("${}", vars_), "${}");
    EXPECT_EQ(substitute("${table", vars_), "${table");
}

TEST_F(TemplateTest, ParameterTokensUntouched) {
    EXPECT_EQ(substitute("WHERE id = @id", vars_), "WHERE id = @id");
}
