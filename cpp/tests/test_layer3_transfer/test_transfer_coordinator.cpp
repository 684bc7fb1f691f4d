/**
 * @file test_transfer_coordinator.cpp
 * @brief Layer 3 tests for TransferCoordinator over LocalProducerRuntime and FakeProducer.
 *
 * The producer is always declared before the coordinator so it outlives it.
 */
#include "test_patterns.h"
#include "shared_test_helpers.h"
#include "fake_producer.h"
#include "fbr_transfer.hpp"
#include "gmock/gmock.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#if defined(__linux__)
#include <sys/mman.h>
#endif

using namespace filebridge::tests;
using namespace filebridge::tests::helper;
using namespace filebridge::transfer;
using filebridge::utils::TransferConfig;
using namespace std::chrono_literals;
using ::testing::HasSubstr;

namespace
{

constexpr size_t kFileSize = 256 * 1024;

std::vector<uint8_t> slice_of(const std::vector<uint8_t> &bytes, uint64_t pos, size_t n)
{
    if (pos >= bytes.size())
        return {};
    n = std::min<size_t>(n, bytes.size() - static_cast<size_t>(pos));
    return std::vector<uint8_t>(bytes.begin() + static_cast<ptrdiff_t>(pos),
                                bytes.begin() + static_cast<ptrdiff_t>(pos + n));
}

} // namespace

// ============================================================================
// Initialization
// ============================================================================

class CoordinatorInitTest : public PureApiTest
{
  protected:
    static void add_input(LocalProducerRuntime &producer)
    {
        FileInfo info;
        info.name = "input.bin";
        producer.add_memory_file("input", info, make_pattern_bytes(1024));
    }
};

TEST_F(CoordinatorInitTest, LazyInitInjectsBootstrapOnceAndPolls)
{
    LocalProducerRuntime producer(LocalProducerOptions{.polls_until_ready = 2});
    add_input(producer);
    TransferCoordinator coordinator(producer, fast_config(false));
    EXPECT_FALSE(coordinator.is_initialized());
    EXPECT_EQ(producer.ready_probe_count(), 0) << "construction does not touch the producer";

    const FileRef ref = coordinator.open_read("input", 0);
    EXPECT_GE(ref, 1);
    EXPECT_TRUE(coordinator.is_initialized());
    EXPECT_EQ(producer.bootstrap_count(), 1);
    EXPECT_EQ(producer.ready_probe_count(), 4) << "one probe, then three polls";

    std::vector<uint8_t> dest(16);
    EXPECT_EQ(coordinator.read_range(ref, 0, 16, dest), 16u);
    EXPECT_EQ(producer.bootstrap_count(), 1);
    EXPECT_EQ(producer.ready_probe_count(), 4) << "no probes once ready";
}

TEST_F(CoordinatorInitTest, ReadyProducerNeedsNoBootstrap)
{
    LocalProducerRuntime producer(LocalProducerOptions{.ready_at_start = true});
    add_input(producer);
    TransferCoordinator coordinator(producer, fast_config(false));
    coordinator.ensure_initialized();
    EXPECT_TRUE(coordinator.is_initialized());
    EXPECT_EQ(producer.bootstrap_count(), 0);
    EXPECT_EQ(producer.ready_probe_count(), 1);
}

TEST_F(CoordinatorInitTest, NeverReadyTimesOut)
{
    LocalProducerRuntime producer(LocalProducerOptions{.never_ready = true});
    add_input(producer);
    TransferConfig cfg = fast_config(false);
    cfg.init_poll_attempts = 4;
    cfg.init_poll_interval = 1ms;
    TransferCoordinator coordinator(producer, cfg);

    try
    {
        coordinator.ensure_initialized();
        FAIL() << "expected InitializationTimeoutError";
    }
    catch (const InitializationTimeoutError &e)
    {
        EXPECT_EQ(e.polls(), 4);
        EXPECT_THAT(e.what(), HasSubstr("not ready after 4 poll(s)"));
    }
    EXPECT_FALSE(coordinator.is_initialized());
    EXPECT_EQ(producer.bootstrap_count(), 1);

    // A later attempt polls again but does not inject a second bootstrap.
    EXPECT_THROW(coordinator.ensure_initialized(), InitializationTimeoutError);
    EXPECT_EQ(producer.bootstrap_count(), 1);
    EXPECT_EQ(producer.ready_probe_count(), 10);
}

TEST_F(CoordinatorInitTest, TimeoutSurfacesFromFirstCall)
{
    LocalProducerRuntime producer(LocalProducerOptions{.never_ready = true});
    add_input(producer);
    TransferCoordinator coordinator(producer, fast_config(true));
    EXPECT_THROW((void)coordinator.open_read("input", 0), InitializationTimeoutError);
    EXPECT_THROW((void)coordinator.file_count("input"), InitializationTimeoutError);
}

TEST_F(CoordinatorInitTest, EagerModeLeavesInitializationToTheCaller)
{
    LocalProducerRuntime producer(LocalProducerOptions{.polls_until_ready = 0});
    add_input(producer);
    TransferConfig cfg = fast_config(false);
    cfg.initialize_on_first_call = false;
    TransferCoordinator coordinator(producer, cfg);

    // The local producer serves reads whether or not it was bootstrapped.
    const FileRef ref = coordinator.open_read("input", 0);
    EXPECT_FALSE(coordinator.is_initialized());
    EXPECT_EQ(producer.ready_probe_count(), 0);
    std::vector<uint8_t> dest(8);
    EXPECT_EQ(coordinator.read_range(ref, 0, 8, dest), 8u);

    coordinator.ensure_initialized();
    EXPECT_TRUE(coordinator.is_initialized());
    EXPECT_EQ(producer.bootstrap_count(), 1);
}

TEST_F(CoordinatorInitTest, ConcurrentFirstCallsInitializeOnce)
{
    LocalProducerRuntime producer(LocalProducerOptions{.polls_until_ready = 3});
    add_input(producer);
    TransferConfig cfg = fast_config(false);
    cfg.init_poll_attempts = 10;
    cfg.init_poll_interval = 2ms;
    TransferCoordinator coordinator(producer, cfg);

    ThreadRacer racer(8);
    ASSERT_TRUE(racer.race([&](int) { coordinator.ensure_initialized(); }));
    EXPECT_EQ(producer.bootstrap_count(), 1);
    EXPECT_EQ(producer.ready_probe_count(), 5);
}

// ============================================================================
// Reads
// ============================================================================

class CoordinatorFileTest : public PureApiTest
{
  protected:
    void SetUp() override
    {
        contents_ = make_pattern_bytes(kFileSize, 77);
        FileInfo info;
        info.name = "input.bin";
        info.type = "application/octet-stream";
        producer_.add_memory_file("input", info, contents_);
    }

    LocalProducerRuntime producer_{LocalProducerOptions{.ready_at_start = true}};
    std::vector<uint8_t> contents_;
};

class CoordinatorReadTest : public CoordinatorFileTest, public ::testing::WithParamInterface<bool>
{
};

TEST_P(CoordinatorReadTest, ReadsRangesOnConfiguredPath)
{
    TransferCoordinator coordinator(producer_, fast_config(GetParam()));
    EXPECT_EQ(coordinator.uses_shared_buffer(), GetParam());
    const FileRef ref = coordinator.open_read("input", 0);

    std::vector<uint8_t> dest(10000);
    ASSERT_EQ(coordinator.read_range(ref, 12345, 10000, dest), 10000u);
    EXPECT_EQ(dest, slice_of(contents_, 12345, 10000));

    // Short read at the end and nothing past it.
    ASSERT_EQ(coordinator.read_range(ref, kFileSize - 10, 10000, dest), 10u);
    const auto tail = slice_of(contents_, kFileSize - 10, 10);
    EXPECT_TRUE(std::equal(tail.begin(), tail.end(), dest.begin()));
    EXPECT_EQ(coordinator.read_range(ref, kFileSize, 100, dest), 0u);
    EXPECT_EQ(coordinator.read_range(ref, kFileSize + 5000, 100, dest), 0u);

    const auto s = coordinator.stats();
    EXPECT_EQ(s.reads, 4u);
    EXPECT_EQ(s.bytes_read, 10010u);
    EXPECT_EQ(s.failed_reads, 0u);
    EXPECT_EQ(coordinator.pool().outstanding(), 0u);
    EXPECT_EQ(coordinator.registry().pending_count(), 0u);
}

TEST_P(CoordinatorReadTest, CountIsClampedToDestination)
{
    TransferCoordinator coordinator(producer_, fast_config(GetParam()));
    const FileRef ref = coordinator.open_read("input", 0);

    std::vector<uint8_t> dest(100, 0xCC);
    EXPECT_EQ(coordinator.read_range(ref, 0, 5000, dest, 40), 60u);
    const auto want = slice_of(contents_, 0, 60);
    EXPECT_TRUE(std::equal(want.begin(), want.end(), dest.begin() + 40));
    EXPECT_EQ(dest[39], 0xCC);

    // An offset equal to the destination size is valid and reads nothing.
    EXPECT_EQ(coordinator.read_range(ref, 0, 10, dest, 100), 0u);
}

TEST_P(CoordinatorReadTest, InvalidRequestsAreRejectedLocally)
{
    TransferCoordinator coordinator(producer_, fast_config(GetParam()));
    const FileRef ref = coordinator.open_read("input", 0);
    std::vector<uint8_t> dest(16);

    EXPECT_THROW((void)coordinator.read_range(-1, 0, 16, dest), InvalidReadRequest);
    EXPECT_THROW((void)coordinator.read_range(ref + 100, 0, 16, dest), InvalidReadRequest);
    EXPECT_THROW((void)coordinator.read_range(ref, 0, 16, dest, 17), InvalidReadRequest);
    EXPECT_THROW((void)coordinator.read_range_base64(-5, 0, 16), InvalidReadRequest);

    ASSERT_TRUE(coordinator.dispose(ref));
    EXPECT_THROW((void)coordinator.read_range(ref, 0, 16, dest), InvalidReadRequest)
        << "a disposed ref is no longer open";

    const auto s = coordinator.stats();
    EXPECT_EQ(s.failed_reads, 5u);
    EXPECT_EQ(s.reads, 0u);
}

TEST_P(CoordinatorReadTest, StoppedTokenCancelsBeforeDispatch)
{
    TransferCoordinator coordinator(producer_, fast_config(GetParam()));
    const FileRef ref = coordinator.open_read("input", 0);
    std::vector<uint8_t> dest(16);
    std::stop_source stop;
    stop.request_stop();
    EXPECT_THROW((void)coordinator.read_range(ref, 0, 16, dest, 0, stop.get_token()),
                 TransferCanceled);
    EXPECT_EQ(coordinator.stats().canceled_reads, 1u);
}

TEST_P(CoordinatorReadTest, Base64AlwaysUsesEncodedPath)
{
    TransferCoordinator coordinator(producer_, fast_config(GetParam()));
    const FileRef ref = coordinator.open_read("input", 0);
    EXPECT_EQ(coordinator.read_range_base64(ref, 100, 30),
              filebridge::crypto::encode_base64(slice_of(contents_, 100, 30)));
    EXPECT_TRUE(coordinator.read_range_base64(ref, kFileSize, 30).empty());
}

TEST_P(CoordinatorReadTest, ConcurrentReadsWithShuffledCompletions)
{
    producer_.set_shuffle_completions(true);
    TransferCoordinator coordinator(producer_, fast_config(GetParam()));
    const FileRef ref = coordinator.open_read("input", 0);

    const int per_thread = scaled_value(40, 10);
    ThreadRacer racer(8);
    ASSERT_TRUE(racer.race(
        [&](int t)
        {
            std::vector<uint8_t> dest(4096);
            for (int i = 0; i < per_thread; ++i)
            {
                const uint64_t pos = static_cast<uint64_t>((t * 7919 + i * 104729) % kFileSize);
                const uint32_t n = coordinator.read_range(ref, pos, 4096, dest);
                const auto want = slice_of(contents_, pos, 4096);
                if (n != want.size() || !std::equal(want.begin(), want.end(), dest.begin()))
                    throw std::runtime_error("read returned another caller's bytes");
            }
        }));

    const auto s = coordinator.stats();
    EXPECT_EQ(s.reads, static_cast<uint64_t>(8 * per_thread));
    EXPECT_EQ(s.failed_reads, 0u);
    EXPECT_EQ(s.integrity_failures, 0u);
    EXPECT_EQ(coordinator.registry().pending_count(), 0u);
}

/**
 * Five files of different lengths, one reader each, completions delivered out of order. Every
 * call must get the byte count and bytes of its own file, including the short final chunk.
 */
TEST_P(CoordinatorReadTest, ParallelReadsOfDistinctFiles)
{
    const std::vector<size_t> lengths{1000, 4097, 65536, 123, 30000};
    std::vector<std::vector<uint8_t>> files;
    for (size_t i = 0; i < lengths.size(); ++i)
    {
        files.push_back(make_pattern_bytes(lengths[i], static_cast<uint32_t>(100 + i)));
        FileInfo info;
        info.name = fmt::format("part{}.bin", i);
        producer_.add_memory_file("batch", info, files.back());
    }
    producer_.set_shuffle_completions(true);
    TransferCoordinator coordinator(producer_, fast_config(GetParam()));
    ASSERT_EQ(coordinator.file_count("batch"), 5);

    std::vector<FileRef> refs;
    for (int i = 0; i < 5; ++i)
        refs.push_back(coordinator.open_read("batch", i));

    ThreadRacer racer(5);
    ASSERT_TRUE(racer.race(
        [&](int t)
        {
            const auto &file = files[static_cast<size_t>(t)];
            const FileRef ref = refs[static_cast<size_t>(t)];
            std::vector<uint8_t> dest(4096);
            for (uint64_t pos = 0; pos <= file.size(); pos += 4096)
            {
                const uint32_t n = coordinator.read_range(ref, pos, 4096, dest);
                const auto want = slice_of(file, pos, 4096);
                if (n != want.size())
                    throw std::runtime_error(fmt::format(
                        "file {} at {}: {} bytes reported, {} expected", t, pos, n, want.size()));
                if (!std::equal(want.begin(), want.end(), dest.begin()))
                    throw std::runtime_error(fmt::format("file {} at {}: wrong bytes", t, pos));
            }
        }));

    EXPECT_EQ(coordinator.stats().failed_reads, 0u);
    EXPECT_EQ(coordinator.registry().pending_count(), 0u);
    EXPECT_EQ(coordinator.pool().outstanding(), 0u);
}

INSTANTIATE_TEST_SUITE_P(BothPaths, CoordinatorReadTest, ::testing::Values(false, true),
                         [](const ::testing::TestParamInfo<bool> &info)
                         { return info.param ? std::string("SharedBuffer") : std::string("Encoded"); });

// ============================================================================
// Shared-buffer specifics
// ============================================================================

class CoordinatorSharedBufferTest : public CoordinatorFileTest
{
};

TEST_F(CoordinatorSharedBufferTest, IntegrityFailuresAreCounted)
{
    TransferCoordinator coordinator(producer_, fast_config(true));
    const FileRef ref = coordinator.open_read("input", 0);
    std::vector<uint8_t> dest(512);

    producer_.inject_shared_buffer_faults(1);
    EXPECT_THROW((void)coordinator.read_range(ref, 0, 512, dest), TransferIntegrityError);
    producer_.inject_shared_buffer_faults(2);
    EXPECT_THROW((void)coordinator.read_range(ref, 0, 512, dest), TransferIntegrityError);
    EXPECT_EQ(coordinator.read_range(ref, 0, 512, dest), 512u);

    const auto s = coordinator.stats();
    EXPECT_EQ(s.integrity_failures, 3u);
    EXPECT_EQ(s.retries, 2u);
    EXPECT_EQ(s.failed_reads, 2u);
    EXPECT_EQ(s.reads, 1u);
}

TEST_F(CoordinatorSharedBufferTest, RecoveredCallsSucceedWhenConfigured)
{
    TransferConfig cfg = fast_config(true);
    cfg.report_recovered_as_failure = false;
    TransferCoordinator coordinator(producer_, cfg);
    const FileRef ref = coordinator.open_read("input", 0);
    std::vector<uint8_t> dest(512);

    producer_.inject_shared_buffer_faults(1);
    EXPECT_EQ(coordinator.read_range(ref, 1000, 512, dest), 512u);
    EXPECT_EQ(dest, slice_of(contents_, 1000, 512));
}

TEST_F(CoordinatorSharedBufferTest, CancellationThenLateCompletion)
{
    TransferCoordinator coordinator(producer_, fast_config(true));
    const FileRef ref = coordinator.open_read("input", 0);
    producer_.set_completion_delay(250ms);

    std::vector<uint8_t> dest(1024);
    std::stop_source stop;
    std::jthread canceller(
        [&stop]()
        {
            std::this_thread::sleep_for(30ms);
            stop.request_stop();
        });
    EXPECT_THROW((void)coordinator.read_range(ref, 0, 1024, dest, 0, stop.get_token()),
                 TransferCanceled);

    producer_.flush();
    const auto s = coordinator.stats();
    EXPECT_EQ(s.canceled_reads, 1u);
    EXPECT_EQ(s.unknown_completions, 1u);
    EXPECT_EQ(coordinator.pool().outstanding(), 0u) << "the late completion freed the buffer";

    producer_.set_completion_delay(0ms);
    EXPECT_EQ(coordinator.read_range(ref, 0, 1024, dest), 1024u);
}

TEST_F(CoordinatorSharedBufferTest, ShutdownCancelsPendingReads)
{
    TransferCoordinator coordinator(producer_, fast_config(true));
    const FileRef ref = coordinator.open_read("input", 0);
    producer_.set_completion_delay(300ms);

    std::vector<uint8_t> dest(256);
    std::jthread reader(
        [&]()
        {
            EXPECT_THROW((void)coordinator.read_range(ref, 0, 256, dest), TransferCanceled);
        });
    std::this_thread::sleep_for(50ms);
    coordinator.shutdown();
    reader.join();
    EXPECT_EQ(coordinator.stats().canceled_reads, 1u);

    producer_.flush();
    EXPECT_EQ(coordinator.pool().outstanding(), 0u) << "shutdown released the parked buffer";
}

/**
 * shutdown() lands at varying points of a large shared-buffer read: before the accepting check,
 * while the buffers are rented and zero-filled, or while the read waits. The reader must always
 * return. The stop source is only a way out if it does not.
 */
TEST_F(CoordinatorSharedBufferTest, ShutdownRacingLargeReadAlwaysReturns)
{
    const int rounds = scaled_value(20, 5);
    for (int round = 0; round < rounds; ++round)
    {
        auto coordinator = std::make_unique<TransferCoordinator>(producer_, fast_config(true));
        const FileRef ref = coordinator->open_read("input", 0);
        std::vector<uint8_t> dest(16 * 1024 * 1024);

        std::stop_source way_out;
        std::promise<std::string> result;
        auto finished = result.get_future();
        std::jthread reader(
            [&]()
            {
                try
                {
                    (void)coordinator->read_range(ref, 0, 4096, dest, 0, way_out.get_token());
                    result.set_value("");
                }
                catch (const TransferError &e)
                {
                    result.set_value(e.what());
                }
            });

        std::this_thread::sleep_for(std::chrono::microseconds(round * 100));
        coordinator->shutdown();
        if (finished.wait_for(5s) != std::future_status::ready)
        {
            ADD_FAILURE() << "read_range still blocked 5s after shutdown in round " << round;
            way_out.request_stop();
        }
        reader.join();

        const std::string error = finished.get();
        if (!error.empty())
        {
            EXPECT_THAT(error, HasSubstr("shut down")) << "round " << round;
        }
        EXPECT_EQ(coordinator->registry().pending_count(), 0u);
        coordinator.reset();
        producer_.flush();
    }
}

// ============================================================================
// Passthroughs and shutdown
// ============================================================================

class CoordinatorPassthroughTest : public PureApiTest
{
  protected:
    FakeProducer producer_{make_pattern_bytes(300)};
};

TEST_F(CoordinatorPassthroughTest, ForwardsResourceCalls)
{
    TransferCoordinator coordinator(producer_, fast_config(false));
    EXPECT_EQ(producer_.bound_sink(), &coordinator);

    EXPECT_EQ(coordinator.file_count("input"), 1);
    EXPECT_EQ(coordinator.file_count("other"), 0);
    const FileInfo info = coordinator.file_info("input", 0);
    EXPECT_EQ(info.name, "input.bin");
    EXPECT_EQ(info.size, 300u);
    EXPECT_THROW((void)coordinator.file_info("input", 1), TransferError);

    const FileRef ref = coordinator.open_read("input", 0);
    EXPECT_TRUE(coordinator.dispose(ref));
    EXPECT_EQ(producer_.disposed_count(), 1);
    EXPECT_NO_THROW(coordinator.clear_value("input"));
}

TEST_F(CoordinatorPassthroughTest, ShutdownRejectsFurtherCallsAndIsIdempotent)
{
    TransferCoordinator coordinator(producer_, fast_config(false));
    const FileRef ref = coordinator.open_read("input", 0);
    std::vector<uint8_t> dest(16);

    coordinator.shutdown();
    EXPECT_TRUE(coordinator.is_shut_down());
    EXPECT_EQ(producer_.bound_sink(), nullptr);
    coordinator.shutdown();

    try
    {
        (void)coordinator.read_range(ref, 0, 16, dest);
        FAIL() << "expected TransferError";
    }
    catch (const TransferError &e)
    {
        EXPECT_STREQ(e.what(), "coordinator is shut down");
    }
    EXPECT_THROW((void)coordinator.read_range_base64(ref, 0, 16), TransferError);
    EXPECT_THROW((void)coordinator.open_read("input", 0), TransferError);
    EXPECT_THROW((void)coordinator.file_count("input"), TransferError);
    EXPECT_FALSE(coordinator.dispose(ref));
    EXPECT_EQ(producer_.disposed_count(), 0);
}

TEST_F(CoordinatorPassthroughTest, CountIsClampedToSignedLimit)
{
#if defined(__linux__)
    // A destination larger than 2 GiB, committed lazily so only the touched page costs memory.
    const size_t span_size = size_t{kMaxReadCount} + 4096;
    void *mem = ::mmap(nullptr, span_size, PROT_READ | PROT_WRITE,
                       MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
    ASSERT_NE(mem, MAP_FAILED);
    auto unmap = filebridge::basics::make_scope_guard([&]() { ::munmap(mem, span_size); });
    std::span<uint8_t> dest(static_cast<uint8_t *>(mem), span_size);

    uint32_t requested = 0;
    producer_.on_marshalled = [&](const ReadRequest &r) -> std::optional<std::string>
    {
        requested = r.count;
        return filebridge::crypto::encode_base64(producer_.slice(r.position, r.count));
    };
    TransferCoordinator coordinator(producer_, fast_config(false));
    const FileRef ref = coordinator.open_read("input", 0);
    EXPECT_EQ(coordinator.read_range(ref, 0, UINT32_MAX, dest), 300u);
    EXPECT_EQ(requested, kMaxReadCount);
    EXPECT_EQ(dest[299], producer_.contents()[299]);
#else
    GTEST_SKIP() << "needs a lazily committed mapping larger than 2 GiB";
#endif
}

TEST_F(CoordinatorPassthroughTest, UnknownCompletionIsCountedNotFatal)
{
    TransferCoordinator coordinator(producer_, fast_config(true));
    coordinator.on_read_completed(123456789, 10);
    coordinator.on_read_failed(123456790, "late failure");
    EXPECT_EQ(coordinator.stats().unknown_completions, 2u);

    const FileRef ref = coordinator.open_read("input", 0);
    std::vector<uint8_t> dest(50);
    EXPECT_EQ(coordinator.read_range(ref, 250, 50, dest), 50u);
}

// ============================================================================
// Diagnostics logging (isolated: needs the Logger)
// ============================================================================

class CoordinatorLoggingTest : public IsolatedProcessTest
{
  protected:
    TempDir dir_{"fbr_coordinator_log"};
};

TEST_F(CoordinatorLoggingTest, UnknownCorrelationIdIsLoggedOnce)
{
    auto w = SpawnWorker("transfer.unknown_correlation_logged", {(dir_ / "unknown.log").string()});
    ExpectWorkerOk(w);
}

TEST_F(CoordinatorLoggingTest, VerificationFailureIsLoggedWithDumps)
{
    auto w = SpawnWorker("transfer.integrity_failure_logged", {(dir_ / "integrity.log").string()});
    ExpectWorkerOk(w, {}, true);
}
