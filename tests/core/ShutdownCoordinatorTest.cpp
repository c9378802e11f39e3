#include "hb/runtime/ShutdownCoordinator.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hb::runtime;

TEST(ShutdownCoordinatorTest, RunsStepsInAscendingOrder) {
    ShutdownCoordinator sc;
    std::vector<std::string> ran;
    sc.registerStep("late", 60, [&]{ ran.push_back("late"); });
    sc.registerStep("early", 5, [&]{ ran.push_back("early"); });
    sc.registerStep("middle", 40, [&]{ ran.push_back("middle"); });
    sc.stop();
    EXPECT_EQ(ran, (std::vector<std::string>{"early", "middle", "late"}));
    EXPECT_TRUE(sc.stopping());
}

TEST(ShutdownCoordinatorTest, StopIsIdempotent) {
    ShutdownCoordinator sc;
    int calls = 0;
    sc.registerStep("once", 1, [&]{ ++calls; });
    sc.stop();
    sc.stop();
    EXPECT_EQ(calls, 1);
}

TEST(ShutdownCoordinatorTest, FailingStepDoesNotBlockLaterSteps) {
    ShutdownCoordinator sc;
    bool later = false;
    sc.registerStep("boom", 1, []{ throw std::runtime_error("boom"); });
    sc.registerStep("later", 2, [&]{ later = true; });
    EXPECT_NO_THROW(sc.stop());
    EXPECT_TRUE(later);
}
