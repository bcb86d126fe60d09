#include "localjudge/judge/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <system_error>
#include "localjudge/common/exceptions.hpp"
#include "localjudge/common/utils.hpp"
#include "localjudge/run/process.hpp"

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;

compile_result compile_source(const string &compiler,
                              const fs::path &source,
                              const fs::path &output,
                              const string &standard,
                              const vector<string> &extra_flags) {
    process_options opt;
    opt.command = make_command(compiler, source,
                               "-std=" + standard,
                               "-O2", "-pipe",
                               "-Wall", "-Wextra", "-Wshadow", "-Wconversion",
                               "-DLOCAL=1",
                               "-o", output,
                               extra_flags);

    LOG(INFO) << "Compiling: " << boost::algorithm::join(opt.command, " ");

    elapsed_time timer;
    process_result proc;
    try {
        proc = run_process(opt);
    } catch (system_error &e) {
        throw internal_error(fmt::format("Unable to run compiler {}: {}", compiler, e.what()));
    }

    compile_result result;
    result.elapsed = timer.seconds();
    result.stdout_text = move(proc.stdout_text);
    result.stderr_text = move(proc.stderr_text);
    result.success = proc.kind == process_result::outcome::EXITED && proc.exitcode == 0;
    if (result.success) {
        result.message = "Compilation succeeded";
        result.artifact = output;
    } else {
        result.message = "Compilation failed";
        LOG(INFO) << "Compiler exited with code " << proc.exitcode;
    }
    return result;
}

}  // namespace localjudge
