// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>
#include <pgbind/postgres/named_args.h>

#include <cmath>
#include <limits>

using namespace pgbind;
using namespace pgbind::postgres;

TEST(NamedArgsTest, NoParameters) {
    auto out = toPositional(Query{"SELECT 1", {}});
    EXPECT_EQ(out.sql, "SELECT 1");
    EXPECT_TRUE(out.params.empty());
}

TEST(NamedArgsTest, NumbersInOrderOfFirstAppearance) {
    Query query{"SELECT * FROM t WHERE b = @b AND a = @a OR b > @b",
                {{"a", Value(1)}, {"b", Value("x")}}};
    auto out = toPositional(query);
    EXPECT_EQ(out.sql, "SELECT * FROM t WHERE b = $1 AND a = $2 OR b > $1");
    EXPECT_EQ(out.names, (std::vector<std::string>{"b", "a"}));
    ASSERT_EQ(out.params.size(), 2u);
    EXPECT_EQ(out.params[0], "x");
    EXPECT_EQ(out.params[1], "1");
}

TEST(NamedArgsTest, UnboundNamesSendNull) {
    Query query{"INSERT INTO t VALUES (@missing, @nullish)", {{"nullish", Value(nullptr)}}};
    auto out = toPositional(query);
    EXPECT_EQ(out.sql, "INSERT INTO t VALUES ($1, $2)");
    ASSERT_EQ(out.params.size(), 2u);
    EXPECT_FALSE(out.params[0].has_value());
    EXPECT_FALSE(out.params[1].has_value());
}

TEST(NamedArgsTest, QuotedTextLeftAlone) {
    Query query{"SELECT '@a', \"@a\", E'it\\'s @a', 'x''@a' FROM t WHERE c = @a",
                {{"a", Value(5)}}};
    auto out = toPositional(query);
    EXPECT_EQ(out.sql, "SELECT '@a', \"@a\", E'it\\'s @a', 'x''@a' FROM t WHERE c = $1");
    EXPECT_EQ(out.params.size(), 1u);
}

TEST(NamedArgsTest, CommentsAndDollarQuotesLeftAlone) {
    Query query{"-- @a in a comment\n"
                "SELECT $fn$ @a $fn$, $$ @a $$ /* @a /* nested @a */ */ FROM t WHERE c = @a",
                {{"a", Value(5)}}};
    auto out = toPositional(query);
    EXPECT_EQ(out.sql, "-- @a in a comment\n"
                       "SELECT $fn$ @a $fn$, $$ @a $$ /* @a /* nested @a */ */ FROM t WHERE c = $1");
    EXPECT_EQ(out.names, (std::vector<std::string>{"a"}));
}

TEST(NamedArgsTest, OperatorsUntouched) {
    Query query{"SELECT a @> b, c @@ d FROM t WHERE c = @_c1", {{"_c1", Value(true)}}};
    auto out = toPositional(query);
    EXPECT_EQ(out.sql, "SELECT a @> b, c @@ d FROM t WHERE c = $1");
    ASSERT_EQ(out.params.size(), 1u);
    EXPECT_EQ(out.params[0], "true");
}

TEST(NamedArgsTest, ScalarParams) {
    EXPECT_FALSE(toParam(Value()).has_value());
    EXPECT_EQ(toParam(Value(false)), "false");
    EXPECT_EQ(toParam(Value(-3)), "-3");
    EXPECT_EQ(toParam(Value(2.25)), "2.25");
    EXPECT_EQ(toParam(Value(std::numeric_limits<double>::infinity())), "Infinity");
    EXPECT_EQ(toParam(Value(-std::numeric_limits<double>::infinity())), "-Infinity");
    EXPECT_EQ(toParam(Value(std::nan(""))), "NaN");
}

TEST(NamedArgsTest, ArrayLiterals) {
    EXPECT_EQ(arrayLiteral(Value(Value::StringList{"a", "b c"})), "{\"a\",\"b c\"}");
    EXPECT_EQ(arrayLiteral(Value(Value::StringList{"q\"", "back\\"})),
              "{\"q\\\"\",\"back\\\\\"}");
    EXPECT_EQ(arrayLiteral(Value(Value::List{Scalar{int64_t{1}}, Scalar{nullptr},
                                             Scalar{true}})),
              "{\"1\",NULL,\"true\"}");
    EXPECT_EQ(arrayLiteral(Value(Value::StringList{})), "{}");
    EXPECT_EQ(toParam(Value(Value::StringList{"x"})), "{\"x\"}");
}
