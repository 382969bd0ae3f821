/// @file test_terminal.cpp
/// Tests for the line-command front end.

#include "fake_channel.hpp"

#include <chessterm/terminal.hpp>

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

namespace chessterm {
namespace {

using chessterm::test::FakeChannel;

class TerminalTest : public ::testing::Test {
   protected:
    TerminalTest() {
        auto channel = std::make_unique<FakeChannel>();
        channel_ = channel.get();
        session_ = std::make_unique<Session>(std::move(channel));
        terminal_ = std::make_unique<Terminal>(*session_, out_);
    }

    /// Run one command and return what it printed.
    std::string run(const std::string& line) {
        out_.str("");
        last_result_ = terminal_->process_command(line);
        return out_.str();
    }

    std::ostringstream out_;
    FakeChannel* channel_ = nullptr;
    std::unique_ptr<Session> session_;
    std::unique_ptr<Terminal> terminal_;
    bool last_result_ = true;
};

TEST_F(TerminalTest, HelpListsCommands) {
    const auto text = run("help");
    EXPECT_NE(text.find("set position"), std::string::npos);
    EXPECT_NE(text.find("switch"), std::string::npos);
    EXPECT_TRUE(last_result_);
}

TEST_F(TerminalTest, BlankLineIsIgnored) {
    EXPECT_EQ(run("   "), "");
    EXPECT_TRUE(last_result_);
}

TEST_F(TerminalTest, QuitAndExitEndTheLoop) {
    run("quit");
    EXPECT_FALSE(last_result_);
    run("EXIT");
    EXPECT_FALSE(last_result_);
}

TEST_F(TerminalTest, SetPositionSendsMoves) {
    const auto text = run("set position e2e4 e7e5");
    EXPECT_NE(text.find("Position set: position startpos moves e2e4 e7e5"), std::string::npos);
    EXPECT_EQ(channel_->sent().back(), "position startpos moves e2e4 e7e5");
}

TEST_F(TerminalTest, SetFenJoinsTheRest) {
    run("set fen 8/8/8/8/8/8/8/4K2k w - - 0 1");
    EXPECT_EQ(channel_->sent().back(), "position fen 8/8/8/8/8/8/8/4K2k w - - 0 1");
    EXPECT_NE(run("set fen").find("Error: FEN string required."), std::string::npos);
}

TEST_F(TerminalTest, SetTimeShowsClock) {
    const auto text = run("set time 5 2");
    EXPECT_NE(text.find("5 minutes with 2 second increment"), std::string::npos);
    EXPECT_NE(text.find("White: 05:00 | Black: 05:00"), std::string::npos);
    EXPECT_EQ(session_->times(), std::make_pair(300, 300));
}

TEST_F(TerminalTest, SetTimeRejectsGarbage) {
    EXPECT_NE(run("set time five").find("Error: Invalid time values."), std::string::npos);
    EXPECT_NE(run("set time").find("Error: Time in minutes required."), std::string::npos);
    EXPECT_NE(run("set").find("Error: Invalid set command"), std::string::npos);
    EXPECT_NE(run("set colour red").find("Unknown set command 'colour'"), std::string::npos);
}

TEST_F(TerminalTest, BestPrintsAnalysisAndMove) {
    const auto text = run("best 2");
    EXPECT_EQ(channel_->sent().back(), "go depth 2");
    EXPECT_NE(text.find("Depth 2 | Score cp 15 | Line: e2e4 e7e5"), std::string::npos);
    EXPECT_NE(text.find("Best move: e2e4"), std::string::npos);
}

TEST_F(TerminalTest, GoUsesMovetimeAndDefaultDepth) {
    run("go 500");
    EXPECT_EQ(channel_->sent().back(), "go depth 15 movetime 500");
}

TEST_F(TerminalTest, BadSearchArgumentsAreReported) {
    EXPECT_NE(run("best -1").find("Error: "), std::string::npos);
    EXPECT_NE(run("best deep").find("Error: "), std::string::npos);
    EXPECT_TRUE(last_result_);
}

TEST_F(TerminalTest, SwitchAndTimes) {
    run("set time 1 5");
    const auto text = run("switch");
    EXPECT_NE(text.find("Now Black's turn."), std::string::npos);
    EXPECT_NE(text.find("White: 01:05 | Black: 01:00"), std::string::npos);
    EXPECT_NE(run("times").find("White: 01:05 | Black: 01:00"), std::string::npos);
}

TEST_F(TerminalTest, StartAndStop) {
    EXPECT_NE(run("start").find("Timer started. White's move."), std::string::npos);
    EXPECT_TRUE(session_->clock_snapshot().running);
    EXPECT_NE(run("stop").find("Timer stopped."), std::string::npos);
    EXPECT_FALSE(session_->clock_snapshot().running);
}

TEST_F(TerminalTest, DestroyingTerminalStopsTheClock) {
    run("set time 0");
    run("start");
    terminal_.reset();
    EXPECT_FALSE(session_->clock_snapshot().running);

    const auto printed = out_.str();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_EQ(out_.str(), printed);
}

TEST_F(TerminalTest, UnknownCommand) {
    EXPECT_NE(run("castle").find("Unknown command: 'castle'"), std::string::npos);
}

TEST_F(TerminalTest, RunReadsUntilQuit) {
    std::istringstream in("set position d2d4\ntimes\nquit\nset position e2e4\n");
    terminal_->run(in);
    EXPECT_EQ(channel_->sent().back(), "position startpos moves d2d4");
}

TEST_F(TerminalTest, ErrorsAfterEngineLossAreReported) {
    session_->shutdown();
    EXPECT_NE(run("best").find("Error: "), std::string::npos);
    EXPECT_TRUE(last_result_);
}

}  // namespace
}  // namespace chessterm
