#pragma once
/**
 * @file test_patterns.h
 * @brief Three standard test patterns for the filebridge test suite.
 *
 * Lifecycle modules (Logger, CryptoUtils, TransferConfig) are process-global singletons. A
 * test that finalizes them or crashes would corrupt the state of every later test in the
 * same process, so `main()` initializes NOTHING and every test that needs a lifecycle
 * spawns a subprocess.
 *
 * ---
 *
 * ## Pattern 1 - PureApiTest
 *
 * In-process, no lifecycle. For pure functions, data structures and components that work
 * without a running Logger (logging before initialization is a silent no-op).
 *
 *   class BufferPoolTest : public filebridge::tests::PureApiTest { ... };
 *
 * ## Pattern 2 - plain ::testing::Test (in-process, thread-racing only)
 *
 * Thread-racing tests that do NOT need lifecycle modules. Use ThreadRacer from
 * shared_test_helpers.h.
 *
 * ## Pattern 3 - IsolatedProcessTest
 *
 * Spawns one or more subprocesses, each owning its lifecycle. For anything that needs
 * lifecycle modules or inspects log output.
 *
 *   TEST_F(LoggerTest, BasicLogging) {
 *       auto w = SpawnWorker("logger.basic_logging", {log_path});
 *       ExpectWorkerOk(w);
 *   }
 */

#include "gtest/gtest.h"
#include "test_entrypoint.h"
#include "test_process_utils.h"
#include <list>
#include <string>
#include <utility>
#include <vector>

namespace filebridge::tests
{

/**
 * @brief Base class for pure API/function tests. No lifecycle, no module dependencies.
 */
class PureApiTest : public ::testing::Test
{
  protected:
    void SetUp() override {}
    void TearDown() override {}
};

/**
 * @brief Base class for tests that spawn isolated worker subprocesses.
 *
 * SpawnWorker() re-executes the current test binary in "worker mode"; the worker initializes
 * its own lifecycle (run_gtest_worker or run_worker_bare), runs, and exits.
 */
class IsolatedProcessTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ASSERT_FALSE(g_self_exe_path.empty())
            << "g_self_exe_path is empty - test_entrypoint.cpp must set it in main()";
    }

    /**
     * @param scenario Worker mode string, e.g. "logger.basic_logging"
     * @param args     Additional positional arguments passed after the scenario name
     * @param env      Extra "NAME=value" environment entries for the worker
     */
    helper::WorkerProcess SpawnWorker(const std::string &scenario,
                                      std::vector<std::string> args = {},
                                      std::vector<std::string> env = {})
    {
        return helper::WorkerProcess(g_self_exe_path, scenario, args, false, env);
    }

    /**
     * @brief Spawns multiple workers before waiting on any of them.
     *
     * std::list because WorkerProcess is neither copyable nor movable.
     */
    std::list<helper::WorkerProcess>
    SpawnWorkers(std::vector<std::pair<std::string, std::vector<std::string>>> scenarios)
    {
        std::list<helper::WorkerProcess> workers;
        for (auto &[scenario, args] : scenarios)
            workers.emplace_back(g_self_exe_path, scenario, args, false);
        return workers;
    }

    /**
     * @brief Waits for a worker and asserts it succeeded.
     */
    void ExpectWorkerOk(helper::WorkerProcess &proc,
                        std::vector<std::string> expected_stderr_substrings = {},
                        bool allow_expected_logger_errors = false)
    {
        proc.wait_for_exit();
        helper::expect_worker_ok(proc, expected_stderr_substrings, allow_expected_logger_errors);
    }

    void ExpectAllWorkersOk(std::list<helper::WorkerProcess> &workers)
    {
        for (auto &w : workers)
        {
            w.wait_for_exit();
            helper::expect_worker_ok(w);
        }
    }
};

} // namespace filebridge::tests
