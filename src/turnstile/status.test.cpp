//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#include <turnstile/status.hpp>
//
#include <turnstile/status.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace {

tstile::Status foo()
{
    return tstile::OkStatus();
}

enum struct MyCodes {
    OK = 0,
    NOT_REGISTERED,
    BAD,
    TERRIBLE,
    THE_WORST,
};

enum struct HttpCode {
    CONTINUE = 100,
    OK = 200,
    REDIRECT = 300,
    CLIENT_ERROR = 400,
    SERVER_ERROR,
};

class StatusTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        tstile::Status::register_codes<MyCodes>({{MyCodes::OK, "it is ok!"},
                                                 {MyCodes::BAD, "it is bad!"},
                                                 {MyCodes::TERRIBLE, "it is terrible!"},
                                                 {MyCodes::THE_WORST, "The. Worst. Ever."}});

        tstile::Status::register_codes<HttpCode>({{HttpCode::OK, "HTTP Ok"},
                                                  {HttpCode::CONTINUE, "HTTP Continue"},
                                                  {HttpCode::REDIRECT, "HTTP Redirect"},
                                                  {HttpCode::CLIENT_ERROR, "HTTP Client Error"},
                                                  {HttpCode::SERVER_ERROR, "HTTP Server Error"}});
    }
};

TEST_F(StatusTest, DefaultConstruct)
{
    tstile::Status s;

    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.code(), 0);
    EXPECT_THAT(s.message(), ::testing::StrEq("Ok"));
}

TEST_F(StatusTest, BuiltInCodes)
{
    tstile::Status s = tstile::StatusCode::kDeadlineExceeded;

    EXPECT_FALSE(s.ok());
    EXPECT_EQ(s.code(), 4);
    EXPECT_EQ(s, tstile::StatusCode::kDeadlineExceeded);
    EXPECT_NE(s, tstile::StatusCode::kFailedPrecondition);
    EXPECT_THAT(s.message(), ::testing::StrEq("Deadline Exceeded"));
    EXPECT_THAT(tstile::Status{tstile::StatusCode::kFailedPrecondition}.message(),
                ::testing::StrEq("Failed Precondition"));
}

TEST_F(StatusTest, RegisteredEnums)
{
    tstile::Status s2 = MyCodes::BAD;

    EXPECT_EQ(s2.code(), 2);
    EXPECT_EQ(s2, MyCodes::BAD);
    EXPECT_EQ(MyCodes::BAD, s2);
    EXPECT_NE(s2, MyCodes::TERRIBLE);
    EXPECT_THAT(s2.message(), ::testing::StrEq("it is bad!"));
    EXPECT_FALSE(s2.ok());

    EXPECT_THAT(tstile::Status{HttpCode::OK}.message(), ::testing::StrEq("HTTP Ok"));
    EXPECT_THAT(tstile::Status{HttpCode::CONTINUE}.message(), ::testing::StrEq("HTTP Continue"));
    EXPECT_THAT(tstile::Status{HttpCode::SERVER_ERROR}.message(), ::testing::StrEq("HTTP Server Error"));
}

TEST_F(StatusTest, SameValueFromDifferentEnumsIsNotEqual)
{
    // MyCodes::BAD and StatusCode::kUnknown are both 2.
    //
    EXPECT_NE(tstile::Status{MyCodes::BAD}, tstile::StatusCode::kUnknown);
    EXPECT_NE(tstile::Status{tstile::StatusCode::kUnknown}.type_name(), tstile::Status{MyCodes::BAD}.type_name());
}

TEST_F(StatusTest, AllOkCodesAreEqual)
{
    tstile::Status s;

    EXPECT_EQ(s, MyCodes::OK);
    EXPECT_EQ(MyCodes::OK, s);
    EXPECT_TRUE(tstile::Status{MyCodes::OK}.ok());
    EXPECT_THAT(tstile::Status{MyCodes::OK}.message(), ::testing::StrEq("it is ok!"));

    // The ok value is the first one registered, not necessarily zero.
    //
    EXPECT_EQ(s, HttpCode::OK);
    EXPECT_TRUE(tstile::Status{HttpCode::OK}.ok());
    EXPECT_FALSE(tstile::Status{HttpCode::CONTINUE}.ok());
}

TEST_F(StatusTest, RegisterCodesOnlyOnce)
{
    EXPECT_TRUE(tstile::Status::register_codes<MyCodes>({{MyCodes::OK, "replacement"}}));
    EXPECT_THAT(tstile::Status{MyCodes::OK}.message(), ::testing::StrEq("it is ok!"));

    EXPECT_FALSE(tstile::Status::register_codes<tstile::StatusCode>({{tstile::StatusCode::kOk, "Fine"}}));
    EXPECT_THAT(tstile::OkStatus().message(), ::testing::StrEq("Ok"));
}

TEST_F(StatusTest, UnlistedEnumValue)
{
    tstile::Status s = MyCodes::NOT_REGISTERED;

    EXPECT_FALSE(s.ok());
    EXPECT_EQ(s.code(), 1);
    EXPECT_THAT(s.message(), ::testing::StrEq("(unregistered status code)"));
}

TEST_F(StatusTest, IgnoreErrorCompilesOk)
{
    foo().IgnoreError();
}

TEST_F(StatusTest, UpdateKeepsFirstError)
{
    tstile::Status s;

    s.Update(tstile::OkStatus());
    EXPECT_TRUE(s.ok());

    s.Update(MyCodes::BAD);
    s.Update(MyCodes::TERRIBLE);
    s.Update(tstile::OkStatus());

    EXPECT_EQ(s, MyCodes::BAD);
}

TEST_F(StatusTest, PrintMessageTypeAndCode)
{
    std::ostringstream oss;
    oss << tstile::Status{tstile::StatusCode::kFailedPrecondition};

    EXPECT_THAT(oss.str(), ::testing::StrEq("Failed Precondition (tstile::StatusCode=9)"));
}

TEST(StatusDeathTest, UnregisteredEnumType)
{
    enum struct NeverRegistered {
        kOk,
    };

    EXPECT_DEATH(tstile::Status{NeverRegistered::kOk}.IgnoreError(), "have not been registered");
}

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++

tstile::StatusOr<int> parse_digit(char ch)
{
    if (ch < '0' || ch > '9') {
        return tstile::Status{tstile::StatusCode::kInvalidArgument};
    }
    return ch - '0';
}

tstile::Status sum_digits(const std::string& s, int* total)
{
    *total = 0;
    for (char ch : s) {
        tstile::StatusOr<int> digit = parse_digit(ch);
        TSTILE_REQUIRE_OK(digit);

        *total += *digit;
    }
    return tstile::OkStatus();
}

tstile::StatusOr<int> sum_digits_or_error(const std::string& s)
{
    int total = 0;
    TSTILE_REQUIRE_OK(sum_digits(s, &total));

    return total;
}

TEST(StatusOrTest, ValueAndError)
{
    tstile::StatusOr<int> ok_result = parse_digit('7');
    tstile::StatusOr<int> error_result = parse_digit('x');

    ASSERT_TRUE(ok_result.ok());
    EXPECT_EQ(*ok_result, 7);
    EXPECT_EQ(ok_result.value(), 7);

    EXPECT_FALSE(error_result.ok());
    EXPECT_EQ(error_result.status(), tstile::StatusCode::kInvalidArgument);
}

TEST(StatusOrTest, DefaultConstructIsUnknownError)
{
    tstile::StatusOr<std::string> s;

    EXPECT_FALSE(s.ok());
    EXPECT_EQ(s.status(), tstile::StatusCode::kUnknown);
}

TEST(StatusOrTest, ReferenceValue)
{
    std::string target = "hello";
    tstile::StatusOr<std::string&> ref = target;

    ASSERT_TRUE(ref.ok());
    EXPECT_EQ(&*ref, &target);

    ref->append(", world");
    EXPECT_THAT(target, ::testing::StrEq("hello, world"));

    tstile::StatusOr<std::string&> copy = ref;
    EXPECT_EQ(&*copy, &target);
}

TEST(StatusOrTest, Assignment)
{
    tstile::StatusOr<std::string> s = std::string{"abc"};
    ASSERT_TRUE(s.ok());

    s = tstile::Status{tstile::StatusCode::kNotFound};
    EXPECT_EQ(s.status(), tstile::StatusCode::kNotFound);

    s = tstile::StatusOr<std::string>{std::string{"xyz"}};
    ASSERT_TRUE(s.ok());
    EXPECT_THAT(*s, ::testing::StrEq("xyz"));
}

TEST(StatusOrTest, RequireOkPropagatesFirstError)
{
    int total = -1;

    EXPECT_TRUE(sum_digits("123", &total).ok());
    EXPECT_EQ(total, 6);

    EXPECT_EQ(sum_digits("12x3", &total), tstile::StatusCode::kInvalidArgument);
    EXPECT_EQ(total, 3);

    tstile::StatusOr<int> result = sum_digits_or_error("45");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(*result, 9);

    EXPECT_EQ(sum_digits_or_error("4?").status(), tstile::StatusCode::kInvalidArgument);
}

TEST(StatusOrTest, ToStatus)
{
    EXPECT_TRUE(tstile::to_status(parse_digit('1')).ok());
    EXPECT_EQ(tstile::to_status(parse_digit('a')), tstile::StatusCode::kInvalidArgument);
    EXPECT_EQ(tstile::to_status(tstile::Status{tstile::StatusCode::kAborted}), tstile::StatusCode::kAborted);

    EXPECT_TRUE(tstile::is_ok_status(tstile::OkStatus()));
    EXPECT_FALSE(tstile::is_ok_status(parse_digit('a')));
}

TEST(StatusOrTest, Print)
{
    std::ostringstream oss;
    oss << parse_digit('5') << " " << parse_digit('!');

    EXPECT_THAT(oss.str(), ::testing::StrEq("Ok{5} Status{Invalid Argument (tstile::StatusCode=3)}"));
}

}  // namespace
