#include "gtest/gtest.h"
#include "ledger/flag.hpp"

using namespace std;
using namespace ctf::ledger;

TEST(FlagTest, NormalizeTrimsAndLowercases) {
    EXPECT_EQ(normalize_flag("  CTF{Hello_World}\t\n"), "ctf{hello_world}");
    EXPECT_EQ(normalize_flag("   "), "");
    EXPECT_EQ(normalize_flag(""), "");
}

TEST(FlagTest, CheckIgnoresCaseAndSurroundingWhitespace) {
    EXPECT_TRUE(check_flag("flag{abc}", "flag{abc}"));
    EXPECT_TRUE(check_flag("  FLAG{ABC} ", "flag{abc}"));
    EXPECT_TRUE(check_flag("flag{abc}", " Flag{Abc}\n"));
}

TEST(FlagTest, CheckRejectsDifferentFlags) {
    EXPECT_FALSE(check_flag("flag{abd}", "flag{abc}"));
    EXPECT_FALSE(check_flag("flag{abc", "flag{abc}"));
    EXPECT_FALSE(check_flag("flag{abc}x", "flag{abc}"));
    EXPECT_FALSE(check_flag("", "flag{abc}"));
}

TEST(FlagTest, InnerWhitespaceIsSignificant) {
    EXPECT_FALSE(check_flag("flag{a b}", "flag{ab}"));
    EXPECT_TRUE(check_flag("flag{a b}", "FLAG{A B}"));
}
