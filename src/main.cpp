#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <system_error>
#include "localjudge/common/exceptions.hpp"
#include "localjudge/common/utils.hpp"
#include "localjudge/config.hpp"
#include "localjudge/judge/judge.hpp"
#include "localjudge/problem/metadata.hpp"
#include "localjudge/run/measurer.hpp"
using namespace std;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 默认情况下，假设程序运行在项目根目录下的 bin 文件夹中
    filesystem::path current(argv[0]);
    filesystem::path repo_dir(filesystem::weakly_canonical(current).parent_path().parent_path());

    namespace po = boost::program_options;
    po::options_description desc("localjudge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("problem-dir", po::value<string>(), "path to the problem directory")
        ("pid", po::value<string>(), "problem id to judge, looked up in the metadata (overrides the positional path)")
        ("base-dir", po::value<string>(), "root directory that contains problem folders, default to <repo>/problem. You can either pass it from environ PROBLEMDIR")
        ("source", po::value<string>()->default_value(localjudge::DEFAULT_SOURCE), "source file name relative to the problem directory")
        ("std", po::value<string>()->default_value(localjudge::DEFAULT_STANDARD), "C++ standard to use during compilation")
        ("timeout", po::value<double>(), "timeout per test case in seconds, default to the time limit in metadata if available")
        ("cflags", po::value<vector<string>>()->multitoken(), "additional compiler flags")
        ("compiler", po::value<string>(), "set the compiler, default to g++. You can either pass it from environ CXX")
        ("time-binary", po::value<string>(), "set the external measurement program, default to /usr/bin/time. You can either pass it from environ TIMEBINARY")
        ("metadata", po::value<string>(), "set the problem metadata file, default to <repo>/script/luogu_problems.json. You can either pass it from environ METADATA")
        ("debug", "turn on the debug mode to print logs to stderr, and not to delete the build directory to check the compiled program.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("problem-dir", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return localjudge::E_FAILURE;
    }

    if (vm.count("help")) {
        cout << "localjudge: Compile a solution and judge it against the test cases in its problem directory" << endl
             << "Usage: " << argv[0] << " [options] [problem-dir]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "localjudge 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        localjudge::DEBUG = true;
    } else if (getenv("DEBUG")) {
        localjudge::DEBUG = true;
    }
    if (localjudge::DEBUG) FLAGS_alsologtostderr = true;

    if (vm.count("compiler")) {
        localjudge::COMPILER = vm.at("compiler").as<string>();
    } else {
        localjudge::COMPILER = localjudge::get_env("CXX", localjudge::COMPILER);
    }

    if (vm.count("time-binary")) {
        localjudge::TIME_BINARY = filesystem::path(vm.at("time-binary").as<string>());
    } else if (getenv("TIMEBINARY")) {
        localjudge::TIME_BINARY = filesystem::path(getenv("TIMEBINARY"));
    }

    if (vm.count("metadata")) {
        localjudge::METADATA_PATH = filesystem::path(vm.at("metadata").as<string>());
    } else if (getenv("METADATA")) {
        localjudge::METADATA_PATH = filesystem::path(getenv("METADATA"));
    } else {
        localjudge::METADATA_PATH = repo_dir / "script" / "luogu_problems.json";
    }

    if (vm.count("base-dir")) {
        localjudge::PROBLEM_DIR = filesystem::path(vm.at("base-dir").as<string>());
    } else if (getenv("PROBLEMDIR")) {
        localjudge::PROBLEM_DIR = filesystem::path(getenv("PROBLEMDIR"));
    } else {
        localjudge::PROBLEM_DIR = repo_dir / "problem";
    }

    localjudge::judge_request request;
    request.source = vm.at("source").as<string>();
    request.standard = vm.at("std").as<string>();
    request.compiler = localjudge::COMPILER;
    request.keep_build = localjudge::DEBUG;
    if (vm.count("cflags"))
        request.extra_flags = vm.at("cflags").as<vector<string>>();
    if (vm.count("timeout")) {
        double timeout = vm.at("timeout").as<double>();
        if (timeout <= 0) {
            cerr << "Timeout should be positive" << endl;
            return localjudge::E_FAILURE;
        }
        request.timeout = timeout;
    }

    localjudge::metadata_store metadata = localjudge::metadata_store::load(localjudge::METADATA_PATH);
    LOG(INFO) << "Loaded " << metadata.size() << " problem records from " << localjudge::METADATA_PATH;

    if (vm.count("pid")) {
        string pid = vm.at("pid").as<string>();
        filesystem::path base_dir = filesystem::weakly_canonical(localjudge::PROBLEM_DIR);
        localjudge::problem_location location = localjudge::resolve_problem_directory(pid, base_dir, metadata);
        if (!filesystem::is_directory(location.dir)) {
            cerr << fmt::format("Problem directory {} not found for pid {}", location.dir.string(), pid) << endl;
            return localjudge::E_FAILURE;
        }
        request.problem_dir = location.dir;
        request.record = location.record;
        request.label = pid;
    } else if (vm.count("problem-dir")) {
        filesystem::path dir = filesystem::weakly_canonical(vm.at("problem-dir").as<string>());
        if (!filesystem::is_directory(dir)) {
            cerr << fmt::format("Problem directory {} not found", dir.string()) << endl;
            return localjudge::E_FAILURE;
        }
        request.problem_dir = dir;
        request.record = metadata.find_by_directory(dir);
        request.label = request.record && !request.record->pid.empty() ? request.record->pid : dir.filename().string();
    } else {
        cerr << "Provide a problem directory or specify --pid." << endl
             << endl;
        cerr << desc << endl;
        return localjudge::E_FAILURE;
    }

    try {
        auto measurer = localjudge::make_resource_measurer(localjudge::TIME_BINARY);
        localjudge::judge_report report = localjudge::judge_problem(request, *measurer, cout, cerr);
        return report.exitcode;
    } catch (localjudge::resolution_error& e) {
        cerr << e.what() << endl;
        return localjudge::E_FAILURE;
    } catch (localjudge::internal_error& e) {
        LOG(ERROR) << e;
        cerr << e.what() << endl;
        return localjudge::E_FAILURE;
    } catch (system_error& e) {
        LOG(ERROR) << "Unable to run the judge: " << e.what();
        return localjudge::E_FAILURE;
    }
}
