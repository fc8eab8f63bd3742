#include <cstring>

#include <gtest/gtest.h>

#include "urc.h"

using novahttp::ActionResult;
using novahttp::Method;

namespace {

bool action(const char *line, ActionResult &result)
{
    return novahttp::parse_action(line, strlen(line), result);
}

bool header(const char *line, size_t &count)
{
    return novahttp::parse_read_header(line, strlen(line), count);
}

} // namespace

TEST(ParseActionTest, ExtractsStatusAndLength)
{
    ActionResult result;
    ASSERT_TRUE(action("+HTTPACTION: 0,200,42", result));

    EXPECT_EQ(result.method, 0);
    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.length, 42u);
}

TEST(ParseActionTest, AcceptsMissingSpaceAndExtraFields)
{
    ActionResult result;

    ASSERT_TRUE(action("+HTTPACTION:1,404,0", result));
    EXPECT_EQ(result.method, 1);
    EXPECT_EQ(result.status, 404);
    EXPECT_EQ(result.length, 0u);

    ASSERT_TRUE(action("+HTTPACTION: 4,200,17,0", result));
    EXPECT_EQ(result.method, 4);
    EXPECT_EQ(result.length, 17u);
}

TEST(ParseActionTest, RejectsLineWithoutPrefix)
{
    ActionResult result;

    EXPECT_FALSE(action("garbage+HTTPACTION", result));
    EXPECT_FALSE(action("garbage+HTTPACTION: 0,200,42", result));
    EXPECT_FALSE(action("+HTTPACTION 0,200,42", result));
    EXPECT_FALSE(action("", result));
}

TEST(ParseActionTest, RejectsMalformedFields)
{
    ActionResult result;

    EXPECT_FALSE(action("+HTTPACTION: 0,200", result));
    EXPECT_FALSE(action("+HTTPACTION: 0,abc,42", result));
    EXPECT_FALSE(action("+HTTPACTION: 0,200,4x", result));
    EXPECT_FALSE(action("+HTTPACTION: 0,,42", result));
    EXPECT_FALSE(action("+HTTPACTION: 0,200,-1", result));
    EXPECT_FALSE(action("+HTTPACTION: (0-4)", result));
}

TEST(ParseActionTest, RejectsOutOfRangeFields)
{
    ActionResult result;

    EXPECT_FALSE(action("+HTTPACTION: 0,200,999999999999999999", result));
    EXPECT_FALSE(action("+HTTPACTION: 0,200,99999999999999999999999", result));
    EXPECT_FALSE(action("+HTTPACTION: 0,4294967496,1", result));
    EXPECT_FALSE(action("+HTTPACTION: 4294967296,200,1", result));
    EXPECT_FALSE(action("+HTTPACTION: 0,200,2147483648", result));

    ASSERT_TRUE(action("+HTTPACTION: 0,200,2147483647", result));
    EXPECT_EQ(result.length, 2147483647u);
}

TEST(ParseActionTest, LeavesResultUntouchedOnFailure)
{
    ActionResult result;
    result.status = 201;
    result.length = 9;

    EXPECT_FALSE(action("+HTTPACTION: 0,abc,1", result));
    EXPECT_EQ(result.status, 201);
    EXPECT_EQ(result.length, 9u);
}

TEST(ParseReadHeaderTest, AcceptsBothHeaderForms)
{
    size_t count = 0;

    ASSERT_TRUE(header("+HTTPREAD: 42", count));
    EXPECT_EQ(count, 42u);

    ASSERT_TRUE(header("+HTTPREAD: DATA,17", count));
    EXPECT_EQ(count, 17u);

    ASSERT_TRUE(header("+HTTPREAD:0", count));
    EXPECT_EQ(count, 0u);
}

TEST(ParseReadHeaderTest, RejectsOtherLines)
{
    size_t count = 0;

    EXPECT_FALSE(header("+HTTPREAD: DATA", count));
    EXPECT_FALSE(header("+HTTPREAD: 0,42", count));
    EXPECT_FALSE(header("OK", count));
    EXPECT_FALSE(header("+HTTPREAD: DATA,99999999999999999999", count));
}

TEST(MethodTest, CodesMatchModemNumbering)
{
    EXPECT_EQ(static_cast<int>(Method::get), 0);
    EXPECT_EQ(static_cast<int>(Method::post), 1);
    EXPECT_EQ(static_cast<int>(Method::put), 4);

    EXPECT_STREQ(novahttp::method_name(Method::get), "GET");
    EXPECT_STREQ(novahttp::method_name(Method::post), "POST");
    EXPECT_STREQ(novahttp::method_name(Method::put), "PUT");
}
