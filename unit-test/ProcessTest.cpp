#include <signal.h>
#include <sys/wait.h>
#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "localjudge/common/utils.hpp"
#include "localjudge/run/process.hpp"
#include "test/problem_dir.hpp"

using namespace std;
using namespace std::filesystem;
using namespace localjudge;
using ::testing::HasSubstr;

static process_result run_shell(const string &script, optional<double> wall_limit = nullopt, const path &stdin_filename = path()) {
    process_options opt;
    opt.command = make_command("/bin/sh", "-c", script);
    opt.stdin_filename = stdin_filename;
    opt.wall_limit = wall_limit;
    return run_process(opt);
}

TEST(ProcessTest, ExitCodeTest) {
    process_result result = run_shell("exit 0");
    EXPECT_EQ(result.kind, process_result::outcome::EXITED);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_FALSE(result.timed_out());

    result = run_shell("exit 3");
    EXPECT_EQ(result.kind, process_result::outcome::EXITED);
    EXPECT_EQ(result.exitcode, 3);
}

TEST(ProcessTest, CaptureOutputTest) {
    process_result result = run_shell("echo hello; echo world >&2");
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.stderr_text, "world\n");
}

TEST(ProcessTest, LargeOutputTest) {
    // 输出超过管道缓冲区大小时不能死锁
    process_result result = run_shell("i=0; while [ $i -lt 20000 ]; do echo 0123456789; i=$((i+1)); done", 30);
    EXPECT_EQ(result.kind, process_result::outcome::EXITED);
    EXPECT_EQ(result.stdout_text.size(), 20000u * 11);
}

TEST(ProcessTest, StdinTest) {
    test::problem_dir dir;
    path input = dir.write("1.in", "2 3\n");
    process_result result = run_shell("cat", 10, input);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_text, "2 3\n");

    // 没有输入文件时从 /dev/null 读入
    result = run_shell("cat", 10);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_text, "");
}

TEST(ProcessTest, TimeoutTest) {
    process_result result = run_shell("echo started; sleep 10", 0.5);
    EXPECT_EQ(result.kind, process_result::outcome::TIMEOUT);
    EXPECT_TRUE(result.timed_out());
    EXPECT_LT(result.wall_time, 5);
    EXPECT_EQ(result.stdout_text, "started\n");
}

TEST(ProcessTest, KillProcessGroupTest) {
    // 子进程派生的后台进程持有输出管道，超时后也必须被杀死
    process_result result = run_shell("sleep 10 & sleep 10", 0.5);
    EXPECT_TRUE(result.timed_out());
    EXPECT_LT(result.wall_time, 5);
}

TEST(ProcessTest, SignaledTest) {
    process_result result = run_shell("kill -9 $$", 10);
    EXPECT_EQ(result.kind, process_result::outcome::SIGNALED);
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_EQ(result.exitcode, 128 + SIGKILL);
}

TEST(ProcessTest, InvalidUtf8Test) {
    process_result result = run_shell("printf 'a\\377b'");
    EXPECT_EQ(result.stdout_text, "a\xef\xbf\xbd" "b");
}

TEST(ProcessTest, MissingCommandTest) {
    process_options opt;
    opt.command = make_command("/nonexistent/localjudge-program");
    EXPECT_THROW(run_process(opt), system_error);
}

TEST(ProcessTest, MissingInputTest) {
    process_options opt;
    opt.command = make_command("/bin/cat");
    opt.stdin_filename = "/nonexistent/1.in";
    EXPECT_THROW(run_process(opt), system_error);
}

TEST(ProcessTest, EmptyCommandTest) {
    process_options opt;
    EXPECT_THROW(run_process(opt), invalid_argument);
}

TEST(ProcessTest, NoChildLeftTest) {
    // 无论正常结束、超时还是启动失败，子进程都要被回收，不能留下僵尸进程
    run_shell("exit 1");
    run_shell("sleep 10 & sleep 10", 0.5);
    process_options opt;
    opt.command = make_command("/nonexistent/localjudge-program");
    EXPECT_THROW(run_process(opt), system_error);

    int status = 0;
    EXPECT_LE(waitpid(-1, &status, WNOHANG), 0);
}
