/**
 * @file test_lifecycle.cpp
 * @brief Layer 2 tests for the LifecycleManager and LifecycleGuard.
 *
 * The lifecycle is a process-wide singleton that initializes once, so every scenario runs in
 * its own worker process. Fatal configuration errors abort the worker; those tests check the
 * exit status and the status report printed on stderr.
 */
#include "test_patterns.h"
#include "gmock/gmock.h"
#include <gtest/gtest.h>

using namespace filebridge::tests;
using ::testing::HasSubstr;

class LifecycleTest : public IsolatedProcessTest
{
};

TEST_F(LifecycleTest, StartupFollowsDependencies)
{
    auto w = SpawnWorker("lifecycle.startup_order");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, FinalizeReversesStartup)
{
    auto w = SpawnWorker("lifecycle.finalize_order");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, InitAndFinalizeAreIdempotent)
{
    auto w = SpawnWorker("lifecycle.idempotent");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, SecondGuardIsNoOp)
{
    auto w = SpawnWorker("lifecycle.second_guard");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, UnresolvedDependencyAborts)
{
    auto w = SpawnWorker("lifecycle.unresolved_dependency");
    ASSERT_NE(w.wait_for_exit(), 0);
    EXPECT_THAT(w.get_stderr(), HasSubstr("[FBR_LifeCycle] FATAL: Undefined dependency:"));
}

TEST_F(LifecycleTest, CircularDependencyAborts)
{
    auto w = SpawnWorker("lifecycle.circular_dependency");
    ASSERT_NE(w.wait_for_exit(), 0);
    EXPECT_THAT(w.get_stderr(), HasSubstr("[FBR_LifeCycle] FATAL: Circular dependency detected"));
}

TEST_F(LifecycleTest, StartupExceptionAbortsWithModuleStatus)
{
    auto w = SpawnWorker("lifecycle.startup_exception");
    ASSERT_NE(w.wait_for_exit(), 0);
    const auto &err = w.get_stderr();
    EXPECT_THAT(err, HasSubstr("Exception during startup: producer bootstrap missing"));
    EXPECT_THAT(err, HasSubstr("Module 'Failing' was point of failure."));
    EXPECT_THAT(err, HasSubstr("'Failing' [Failed]"));
}

TEST_F(LifecycleTest, RegisterAfterInitAborts)
{
    auto w = SpawnWorker("lifecycle.register_after_init");
    ASSERT_NE(w.wait_for_exit(), 0);
    EXPECT_THAT(w.get_stderr(), HasSubstr("register_module('Late') called after initialization"));
}

TEST_F(LifecycleTest, ShutdownTimeoutIsReported)
{
    auto w = SpawnWorker("lifecycle.shutdown_timeout");
    ExpectWorkerOk(w, {"shutdown of 'Slow' timed out after 50ms"});
}
