#include <gtest/gtest.h>

#include "ui/window_handle.h"
#include "fakes.h"

using namespace ksboot;
using ksboot::testing::FakeLauncher;

TEST(WindowHandleTest, BrowserWindowRunsOpenerWithUrl) {
    FakeLauncher launcher;
    BrowserWindow window(launcher, {"cmd", "/c", "start", ""});
    window.navigate("http://localhost:3000");

    ASSERT_EQ(launcher.specs.size(), 1u);
    EXPECT_EQ(launcher.specs[0].program, "cmd");
    EXPECT_EQ(launcher.specs[0].args,
              (std::vector<std::string>{"/c", "start", "", "http://localhost:3000"}));
}

TEST(WindowHandleTest, BrowserWindowFallsBackToConsole) {
    FakeLauncher launcher;
    launcher.failing = {"xdg-open"};
    BrowserWindow window(launcher, {"xdg-open"});

    ::testing::internal::CaptureStdout();
    window.navigate("http://localhost:3000");
    auto out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("Server ready: http://localhost:3000"), std::string::npos);
}

TEST(WindowHandleTest, ConsoleWindowReportsFailureOnStderr) {
    ConsoleWindow window;
    ::testing::internal::CaptureStderr();
    window.showFailure("could not start server");
    auto err = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("Server unavailable: could not start server"), std::string::npos);
}
