#include "localjudge/judge/judge.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/range/adaptors.hpp>
#include <algorithm>
#include <ostream>
#include "localjudge/common/exceptions.hpp"
#include "localjudge/common/io_utils.hpp"
#include "localjudge/common/utils.hpp"
#include "localjudge/config.hpp"
#include "localjudge/judge/checker.hpp"

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;

fs::path find_source(const fs::path &problem_dir, const string &preferred) {
    fs::path candidate = problem_dir / preferred;
    if (!preferred.empty() && fs::is_regular_file(candidate))
        return candidate;

    vector<fs::path> cpp_files;
    for (auto &entry : fs::directory_iterator(problem_dir))
        if (entry.is_regular_file() && entry.path().extension() == ".cpp")
            cpp_files.push_back(entry.path());
    sort(cpp_files.begin(), cpp_files.end());

    if (cpp_files.empty())
        throw resolution_error(fmt::format("No C++ source file found in {}", problem_dir.string()));
    if (cpp_files.size() > 1) {
        string names = boost::algorithm::join(cpp_files | boost::adaptors::transformed([](const fs::path &p) { return p.filename().string(); }), ", ");
        throw resolution_error(fmt::format("Multiple C++ sources found ({}); specify one via --source", names));
    }
    return cpp_files[0];
}

test_result run_single_test(resource_measurer &measurer,
                            const fs::path &executable,
                            const test_case &tc,
                            const optional<double> &timeout) {
    if (!fs::is_regular_file(executable))
        throw internal_error(fmt::format("Executable {} not found", executable.string()));

    process_options opt;
    opt.command = make_command(executable);
    opt.stdin_filename = tc.input_path;
    opt.wall_limit = timeout;

    elapsed_time timer;
    measured_run run = measurer.run(opt);
    double harness_time = timer.seconds();

    test_result result;
    result.name = tc.name;
    result.stdout_text = move(run.process.stdout_text);
    result.stderr_text = move(run.process.stderr_text);

    if (run.process.timed_out()) {
        verdict v = classify_timeout(*timeout);
        result.status = v.status;
        result.message = move(v.message);
        result.time_seconds = timeout;
        return result;
    }

    // 测量值不可信（缺失、为 0 或为负）时使用我们自己测量的时间，内存则没有这样的替代
    result.time_seconds = run.usage.time_seconds;
    if (!result.time_seconds || *result.time_seconds <= 0)
        result.time_seconds = harness_time;
    result.memory_kb = run.usage.memory_kb;

    // 标准输出文件与选手输出一样，不合法的 UTF-8 字节序列替换为 U+FFFD 后再比较
    string expected_text = tc.expected_available ? sanitize_utf8(read_file_content(tc.expected_path, "")) : "";
    verdict v = classify(run.process.exitcode, tc.expected_available,
                         expected_text, result.stdout_text,
                         tc.expected_path.filename().string());
    result.status = v.status;
    result.message = move(v.message);
    return result;
}

static string first_line(const string &message) {
    return message.substr(0, message.find('\n'));
}

string format_result(const test_result &result, const problem_limits &limits) {
    vector<string> parts;
    parts.push_back(fmt::format("[{}] {}", result.name, get_status_code(result.status)));
    if (result.time_seconds)
        parts.push_back(fmt::format("time {:.2f} ms", *result.time_seconds * 1000));
    if (limits.time_limit_ms)
        parts.push_back(fmt::format("limit {:.0f} ms", *limits.time_limit_ms));
    if (result.memory_kb)
        parts.push_back(fmt::format("mem {:.2f} MB", *result.memory_kb / 1024.0));
    if (limits.memory_limit_kb)
        parts.push_back(fmt::format("mem limit {:.2f} MB", *limits.memory_limit_kb / 1024.0));
    parts.push_back(first_line(result.message));
    return boost::algorithm::join(parts, " | ");
}

/**
 * @brief 输出题目的限制，并确定实际使用的时间限制
 */
static optional<double> effective_timeout(const judge_request &request, ostream &out) {
    optional<double> metadata_timeout;
    if (!request.record) return request.timeout;

    const problem_record &record = *request.record;
    const problem_limits &limits = record.limits;
    if (limits.time_limit_ms)
        metadata_timeout = *limits.time_limit_ms / 1000.0;

    string time_desc = record.time_limit_human;
    if (time_desc.empty())
        time_desc = metadata_timeout && *metadata_timeout ? fmt::format("{:.2f}s", *metadata_timeout) : "unknown";
    string mem_desc = record.memory_limit_human;
    if (mem_desc.empty())
        mem_desc = limits.memory_limit_kb && *limits.memory_limit_kb ? fmt::format("{:.2f}MB", *limits.memory_limit_kb / 1024.0) : "unknown";
    string pid = record.pid.empty() ? request.label : record.pid;
    out << fmt::format("{} limits: time <= {}, memory <= {}", pid, time_desc, mem_desc) << endl;

    if (request.timeout) return request.timeout;
    if (metadata_timeout)
        out << fmt::format("Using metadata time limit {:.2f}s as timeout", *metadata_timeout) << endl;
    return metadata_timeout;
}

judge_report judge_problem(const judge_request &request,
                           resource_measurer &measurer,
                           ostream &out,
                           ostream &err) {
    out << "Judging " << request.label << " @ " << request.problem_dir.string() << endl;

    fs::path source = find_source(request.problem_dir, request.source);
    LOG(INFO) << "Judging " << source << " with " << measurer.name();

    optional<double> timeout = effective_timeout(request, out);
    problem_limits limits = request.record ? request.record->limits : problem_limits();

    judge_report report;
    report.exitcode = E_FAILURE;

    // 编译产物放在临时文件夹中，离开作用域时删除
    scoped_temp_directory build_dir("judge_build_");
    if (request.keep_build) build_dir.keep();

    report.compilation = compile_source(request.compiler, source, build_dir.path() / "solution", request.standard, request.extra_flags);
    const compile_result &compilation = report.compilation;
    out << fmt::format("Compile: {} ({:.2f}s)", compilation.message, compilation.elapsed) << endl;
    if (!compilation.stdout_text.empty())
        out << compilation.stdout_text << endl;
    if (!compilation.stderr_text.empty())
        err << compilation.stderr_text << endl;
    if (!compilation.success || !compilation.artifact)
        return report;

    vector<test_case> tests = list_tests(request.problem_dir);
    if (tests.empty()) {
        LOG(WARNING) << "No test case found in " << request.problem_dir;
        out << "No .in files found in " << request.problem_dir.string() << endl;
    }

    bool overall_success = true;
    for (const test_case &tc : tests) {
        test_result result = run_single_test(measurer, *compilation.artifact, tc, timeout);
        out << format_result(result, limits) << endl;

        if (result.status == status::WRONG_ANSWER) {
            // 第一行已经在结果行中输出，这里输出 diff
            auto newline = result.message.find('\n');
            if (newline != string::npos)
                out << result.message.substr(newline + 1) << endl;

            string actual_output = result.stdout_text;
            while (!actual_output.empty() && actual_output.back() == '\n') actual_output.pop_back();
            out << "Program output:" << endl
                << (actual_output.empty() ? "<empty output>" : actual_output) << endl;
        }

        if (result.status != status::ACCEPTED) {
            overall_success = false;
            if (!result.stderr_text.empty())
                err << "stderr:" << endl
                    << result.stderr_text << endl;
        }
        report.results.push_back(move(result));
    }

    report.exitcode = overall_success ? E_ACCEPTED : E_NOT_ACCEPTED;
    return report;
}

}  // namespace localjudge
