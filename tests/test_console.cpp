// ═══════════════════════════════════════════════════════════════════
//  test_console.cpp — Tests for leveled console logging
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <pagedql/console.h>
#include <sstream>

using namespace pagedql;

class ConsoleTest : public ::testing::Test {
protected:
    std::ostringstream out;
    console::Level saved = console::level();

    void SetUp() override { console::setStream(&out); }
    void TearDown() override {
        console::setStream(nullptr);
        console::setLevel(saved);
    }
};

TEST_F(ConsoleTest, DefaultLevelDropsDebug) {
    console::setLevel(console::Level::Info);
    console::debug("hidden");
    console::info("shown", 42, true);
    EXPECT_EQ(out.str().find("hidden"), std::string::npos);
    EXPECT_NE(out.str().find("shown 42 true"), std::string::npos);
}

TEST_F(ConsoleTest, DebugLevelShowsEverything) {
    console::setLevel(console::Level::Debug);
    EXPECT_TRUE(console::enabled(console::Level::Debug));
    console::debug("content query", "Book", "predicates:", 2);
    EXPECT_NE(out.str().find("content query Book predicates: 2"), std::string::npos);
}

TEST_F(ConsoleTest, OffSilencesErrors) {
    console::setLevel(console::Level::Off);
    console::error("boom");
    console::warn("careful");
    EXPECT_TRUE(out.str().empty());
    EXPECT_FALSE(console::enabled(console::Level::Error));
}

TEST_F(ConsoleTest, JsonArgumentsAreDumped) {
    console::setLevel(console::Level::Info);
    console::log("hint", nlohmann::json{{"fetchSize", 1000}});
    EXPECT_NE(out.str().find(R"({"fetchSize":1000})"), std::string::npos);
}

TEST_F(ConsoleTest, Timers) {
    console::setLevel(console::Level::Debug);
    console::time("resolve");
    EXPECT_GE(console::timeEnd("resolve"), 0.0);
    EXPECT_NE(out.str().find("resolve:"), std::string::npos);

    EXPECT_LT(console::timeEnd("resolve"), 0.0);
    EXPECT_NE(out.str().find("Timer 'resolve' does not exist"), std::string::npos);
}
