/**
 * @file test_platform_debug.cpp
 * @brief Layer 0 tests for debug utilities (debug_msg, FBR_PANIC, stack traces)
 *
 * Tests cover:
 * - Debug message output and formatting
 * - Panic/abort behavior
 * - Stack trace generation
 * - Source location helpers
 */
#include "fbr_base.hpp"
#include "shared_test_helpers.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace filebridge::debug;
using namespace filebridge::format_tools;
using namespace ::testing;
using filebridge::tests::helper::StringCapture;

// ============================================================================
// Debug Message Tests
// ============================================================================

TEST(PlatformDebugTest, DebugMsg_BasicOutput)
{
    StringCapture capture(STDERR_FILENO);

    debug_msg("Test message with value {}", 42);

    std::string output = capture.GetOutput();
    EXPECT_EQ(output, "[DBG]  Test message with value 42\n");
}

TEST(PlatformDebugTest, DebugMsg_MultipleArgs)
{
    StringCapture capture(STDERR_FILENO);

    debug_msg("fileRef {} pos {} count {}", 3, 4096u, std::string("all"));

    EXPECT_THAT(capture.GetOutput(), HasSubstr("fileRef 3 pos 4096 count all"));
}

// ============================================================================
// Source Location Tests
// ============================================================================

TEST(PlatformDebugTest, SourceLocation_ToStringFormat)
{
    std::source_location loc = std::source_location::current();
    std::string result = SRCLOC_TO_STR(loc);

    std::string expected_filename{filename_only(loc.file_name())};

    EXPECT_THAT(result, StartsWith(expected_filename + ":"));
    EXPECT_THAT(result, HasSubstr(std::to_string(loc.line())));
    EXPECT_THAT(result, EndsWith(std::string(":") + loc.function_name()));
}

TEST(PlatformDebugTest, SourceLocation_HereString)
{
    std::string loc_str = FBR_LOC_HERE_STR;

    EXPECT_THAT(loc_str, HasSubstr(std::string(filename_only(__FILE__))));
    EXPECT_FALSE(loc_str.empty());
}

// ============================================================================
// Stack Trace Tests
// ============================================================================

/**
 * Redirects to a file rather than a pipe: the trace can exceed the pipe buffer.
 */
TEST(PlatformDebugTest, StackTrace_GeneratesOutput)
{
    const auto temp_path = std::filesystem::temp_directory_path() /
                           fmt::format("fbr_stack_trace_{}.log", filebridge::platform::get_pid());
    const std::string temp_path_str = temp_path.string();

    int stderr_copy = dup(fileno(stderr));
    int log_fd = ::open(temp_path_str.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    ASSERT_NE(log_fd, -1);
    dup2(log_fd, fileno(stderr));
    close(log_fd);

    print_stack_trace();
    fflush(stderr);

    dup2(stderr_copy, fileno(stderr));
    close(stderr_copy);

    std::string output;
    ASSERT_TRUE(filebridge::tests::helper::read_file_contents(temp_path_str, output));
    std::filesystem::remove(temp_path);

    EXPECT_THAT(output, HasSubstr("Stack Trace (most recent call first):"));
}

// ============================================================================
// Panic Tests
// ============================================================================

[[noreturn]] static void function_that_panics()
{
    FBR_PANIC("This is a test panic message");
}

TEST(PlatformDebugTest, Panic_AbortsWithMessage)
{
    EXPECT_DEATH(function_that_panics(),
                 AllOf(HasSubstr("This is a test panic message"), HasSubstr("PANIC")));
}

[[noreturn]] static void function_with_formatted_panic()
{
    FBR_PANIC("Panic with value: {}", 42);
}

TEST(PlatformDebugTest, Panic_SupportsFormatting)
{
    EXPECT_DEATH(function_with_formatted_panic(), HasSubstr("Panic with value: 42"));
}
