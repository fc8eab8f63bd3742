#include <string>

#include <gtest/gtest.h>

#include "debug.h"
#include "fake_modem.h"

#if (NOVAHTTP_DEBUG > 0)

namespace {

class DebugTest : public ::testing::Test {
protected:
    DebugTest() : modem(FakeModem::instance())
    {
        modem.reset();
    }

    const std::string &last() const
    {
        return modem.logs.back().second;
    }

    FakeModem &modem;
};

} // namespace

TEST_F(DebugTest, DumpEscapesControlBytes)
{
    const char data[] = "AT+HTTPINIT\r\n{}\x1A";
    novahttp_debug_dump(NOVAHTTP_DEBUG_TRACE, "TX", data, sizeof(data) - 1);

    ASSERT_EQ(modem.logs.size(), 1u);
    EXPECT_EQ(modem.logs.back().first, NOVAHTTP_DEBUG_TRACE);
    EXPECT_EQ(last(), "TX: AT+HTTPINIT\\r\\n{}\\x1A\n");
}

TEST_F(DebugTest, LongDumpIsCutShort)
{
    const std::string body(1000, 'b');
    novahttp_debug_dump(NOVAHTTP_DEBUG_TRACE, "RX", body.data(), body.size());

    EXPECT_LT(last().size(), 256u);
    EXPECT_EQ(last().compare(0, 4, "RX: "), 0);
    EXPECT_EQ(last().substr(last().size() - 4), "...\n");
}

TEST_F(DebugTest, LongMessageIsCutShort)
{
    const std::string url(400, 'u');
    novahttp_debug_print(NOVAHTTP_DEBUG_INFO, "GET %s\n", url.c_str());

    EXPECT_EQ(last().size(), 255u);
    EXPECT_EQ(last().substr(last().size() - 4), "...\n");
}

#endif // (NOVAHTTP_DEBUG > 0)
