//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#include <turnstile/assert.hpp>
//
#include <turnstile/assert.hpp>

#include <gtest/gtest.h>

#include <turnstile/status.hpp>

namespace {

TEST(Check, BasicFailDeath)
{
    EXPECT_DEATH(TSTILE_CHECK_EQ(1, 2) << "Special message", "Assert.*failed.*1.*==.*2.*Special message");
}

TEST(Check, PassDoesNotEvaluateMessage)
{
    int evaluated = 0;
    TSTILE_CHECK_LT(1, 2) << (evaluated += 1);

    EXPECT_EQ(evaluated, 0);
}

TEST(Check, StatusOrOkDeath)
{
    tstile::StatusOr<int> ok_value = 3;
    TSTILE_CHECK_OK(ok_value);

    EXPECT_DEATH(TSTILE_CHECK_OK(tstile::StatusOr<int>{tstile::Status{tstile::StatusCode::kNotFound}}),
                 "Assertion failed.*Not Found");
}

TEST(Check, StatusOkDeath)
{
    TSTILE_CHECK_OK(tstile::OkStatus());

    EXPECT_DEATH(TSTILE_CHECK_OK(tstile::Status{tstile::StatusCode::kDeadlineExceeded}) << "while waiting",
                 "Assertion failed.*kDeadlineExceeded.*Deadline Exceeded.*while waiting");
}

}  // namespace
