#include <gtest/gtest.h>
#include <nanoclaw/core/process.hpp>

#include <csignal>
#include <string>
#include <vector>

using namespace nanoclaw;

static ProcessOptions shell(const std::string& script) {
    ProcessOptions o;
    o.argv.push_back("/bin/sh");
    o.argv.push_back("-c");
    o.argv.push_back(script);
    o.timeout_ms = 10000;
    o.max_output_bytes = 1024 * 1024;
    o.kill_grace_ms = 200;
    return o;
}

TEST(CappedBufferTest, DropsBytesPastCap) {
    CappedBuffer buf(5);
    buf.append("abc", 3);
    EXPECT_FALSE(buf.truncated());
    buf.append("defg", 4);
    EXPECT_EQ("abcde", buf.data());
    EXPECT_TRUE(buf.truncated());
    EXPECT_EQ(2u, buf.dropped());
}

TEST(CappedBufferTest, ExactlyAtCapIsNotTruncated) {
    CappedBuffer buf(4);
    buf.append("abcd", 4);
    EXPECT_FALSE(buf.truncated());
    EXPECT_EQ("abcd", buf.data());
}

TEST(ProcessTest, StdinIsDeliveredAndClosed) {
    ProcessOptions o = shell("cat");
    o.stdin_data = "{\"prompt\":\"hello\"}";
    ProcessResult r = run_process(o);
    ASSERT_TRUE(r.spawned) << r.spawn_error;
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(0, r.exit_code);
    EXPECT_EQ(o.stdin_data, r.stdout_data);
}

TEST(ProcessTest, LargeStdinDoesNotDeadlock) {
    ProcessOptions o = shell("cat");
    o.stdin_data = std::string(2 * 1024 * 1024, 'p');
    o.max_output_bytes = 4 * 1024 * 1024;
    ProcessResult r = run_process(o);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(0, r.exit_code);
    EXPECT_EQ(o.stdin_data.size(), r.stdout_data.size());
}

TEST(ProcessTest, ChildIgnoringStdinIsFine) {
    ProcessOptions o = shell("echo done");
    o.stdin_data = std::string(1024 * 1024, 'p');
    ProcessResult r = run_process(o);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(0, r.exit_code);
    EXPECT_EQ("done\n", r.stdout_data);
}

TEST(ProcessTest, ExitCodeAndStderr) {
    ProcessResult r = run_process(shell("echo oops >&2; exit 3"));
    EXPECT_EQ(3, r.exit_code);
    EXPECT_EQ(0, r.term_signal);
    EXPECT_EQ("oops\n", r.stderr_data);
}

TEST(ProcessTest, StderrLinesStreamed) {
    std::vector<std::string> lines;
    ProcessOptions o = shell("echo one >&2; printf 'two\\n\\nthree' >&2");
    o.on_stderr_line = [&lines](const std::string& line) { lines.push_back(line); };
    run_process(o);
    std::vector<std::string> expected = { "one", "two", "three" };
    EXPECT_EQ(expected, lines);
}

TEST(ProcessTest, OutputCapTruncatesWithoutBlockingChild) {
    ProcessOptions o = shell("head -c 300000 /dev/zero; echo tail >&2");
    o.max_output_bytes = 1000;
    ProcessResult r = run_process(o);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(0, r.exit_code);
    EXPECT_EQ(1000u, r.stdout_data.size());
    EXPECT_TRUE(r.stdout_truncated);
    EXPECT_FALSE(r.stderr_truncated);
    EXPECT_EQ("tail\n", r.stderr_data);
}

TEST(ProcessTest, OutputExactlyAtCapIsNotTruncated) {
    ProcessOptions o = shell("head -c 1000 /dev/zero");
    o.max_output_bytes = 1000;
    ProcessResult r = run_process(o);
    EXPECT_EQ(1000u, r.stdout_data.size());
    EXPECT_FALSE(r.stdout_truncated);
}

TEST(ProcessTest, TimeoutTerminatesProcessGroup) {
    ProcessOptions o = shell("sleep 30 & sleep 30; wait");
    o.timeout_ms = 300;
    ProcessResult r = run_process(o);
    EXPECT_TRUE(r.spawned);
    EXPECT_TRUE(r.timed_out);
    EXPECT_NE(0, r.exit_code);
    EXPECT_LT(r.duration_ms, 5000);
}

TEST(ProcessTest, SigtermIgnoredEscalatesToSigkill) {
    ProcessOptions o = shell("trap '' TERM; while true; do sleep 1; done");
    o.timeout_ms = 300;
    o.kill_grace_ms = 300;
    ProcessResult r = run_process(o);
    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(SIGKILL, r.term_signal);
    EXPECT_EQ(128 + SIGKILL, r.exit_code);
    EXPECT_LT(r.duration_ms, 5000);
}

TEST(ProcessTest, TimeoutAppliesWhileChildHoldsPipesOpen) {
    // Output arrives, but the child never exits
    ProcessOptions o = shell("echo partial; exec sleep 30");
    o.timeout_ms = 300;
    ProcessResult r = run_process(o);
    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ("partial\n", r.stdout_data);
}

TEST(ProcessTest, SpawnFailureReported) {
    ProcessOptions o;
    o.argv.push_back("/nonexistent/nanoclaw-container");
    o.timeout_ms = 1000;
    o.max_output_bytes = 1024;
    ProcessResult r = run_process(o);
    EXPECT_FALSE(r.spawned);
    EXPECT_FALSE(r.spawn_error.empty());
    EXPECT_FALSE(r.timed_out);
}

TEST(ProcessTest, EmptyCommandRejected) {
    ProcessResult r = run_process(ProcessOptions());
    EXPECT_FALSE(r.spawned);
    EXPECT_EQ("empty command", r.spawn_error);
}
