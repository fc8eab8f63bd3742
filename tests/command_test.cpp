#include <cstring>
#include <string>

#include <gtest/gtest.h>

#include "command.h"

using novahttp::Command;
using novahttp::Response;
using novahttp::UploadRequest;

namespace {

std::string text(const Command &cmd)
{
    return std::string(reinterpret_cast<const char*>(cmd.data()), cmd.size());
}

bool expects(const Command &cmd, const char *line)
{
    return cmd.expected(line, strlen(line));
}

} // namespace

TEST(CommandTest, PrefixesAtAndTerminatesWithCrLf)
{
    const Command cmd(500, "+HTTPINIT");

    EXPECT_EQ(text(cmd), "AT+HTTPINIT\r\n");
    EXPECT_EQ(cmd.timeout(), 500u);
}

TEST(CommandTest, DefaultIsBareAt)
{
    const Command cmd;

    EXPECT_EQ(text(cmd), "AT\r\n");
    EXPECT_EQ(cmd.timeout(), novahttp::kDefaultTimeout);
}

TEST(CommandTest, RawKeepsTextVerbatim)
{
    const Command cmd = Command::raw(2000, "AT+CGACT=1,1");

    EXPECT_EQ(text(cmd), "AT+CGACT=1,1\r\n");
    EXPECT_EQ(cmd.timeout(), 2000u);
}

TEST(CommandTest, RawRejectsEmptyText)
{
    EXPECT_EQ(Command::raw(100, "").size(), 0u);
    EXPECT_EQ(Command::raw(100, nullptr).size(), 0u);
}

TEST(CommandTest, ExpectsOkByDefault)
{
    const Command cmd(100, "+HTTPTERM");

    EXPECT_TRUE(expects(cmd, "OK"));
    EXPECT_FALSE(expects(cmd, "ERROR"));
    EXPECT_FALSE(expects(cmd, "O"));
}

TEST(CommandTest, ExpectReplacesDefaultPrefix)
{
    Command cmd(100, "+HTTPDATA=5,1000");
    cmd.expect("DOWNLOAD").expect(">");

    EXPECT_TRUE(expects(cmd, "DOWNLOAD"));
    EXPECT_TRUE(expects(cmd, ">"));
    EXPECT_FALSE(expects(cmd, "OK"));
}

TEST(ResponseTest, FindReturnsFirstMatchingLine)
{
    Response response;
    EXPECT_TRUE(response.empty());

    response.add("+CGPADDR: 1,10.0.0.2", 20);
    response.add("OK", 2);

    const std::string *line = response.find("+CGPADDR:");
    ASSERT_NE(line, nullptr);
    EXPECT_EQ(*line, "+CGPADDR: 1,10.0.0.2");
    EXPECT_EQ(response.find("ERROR"), nullptr);

    response.clear();
    EXPECT_TRUE(response.empty());
}

TEST(UploadRequestTest, LengthFollowsPayload)
{
    const char body[] = "{\"msg\":\"Hello POST\"}";
    const UploadRequest request(body, strlen(body), 30000);

    EXPECT_EQ(request.length(), strlen(body));
    EXPECT_EQ(memcmp(request.data(), body, request.length()), 0);
    EXPECT_EQ(request.timeout(), 30000u);
    EXPECT_EQ(novahttp::kUploadTerminator, 0x1A);
}
