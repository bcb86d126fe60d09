#include "localjudge/run/measurer.hpp"
#include <glog/logging.h>
#include <sys/resource.h>
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <vector>
#include "localjudge/common/io_utils.hpp"
#include "localjudge/common/utils.hpp"

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;

template <typename T>
static optional<T> try_to_parse(const string &text) {
    try {
        return boost::lexical_cast<T>(text);
    } catch (boost::bad_lexical_cast &) {
        return nullopt;
    }
}

resource_measurer::~resource_measurer() {}

time_measurement read_time_output(const fs::path &file) {
    time_measurement result;
    ifstream fin(file);
    if (!fin) return result;

    string line, last;
    while (getline(fin, line)) {
        boost::trim(line);
        if (!line.empty()) last = line;
    }

    vector<string> parts;
    boost::split(parts, last, boost::is_space(), boost::token_compress_on);
    if (last.empty() || parts.size() < 2) return result;

    auto seconds = try_to_parse<double>(parts[0]);
    auto memory = try_to_parse<double>(parts[1]);
    if (!seconds || !memory) return result;

    result.time_seconds = seconds;
    result.memory_kb = (long)*memory;
    return result;
}

external_time_measurer::external_time_measurer(const fs::path &time_binary)
    : time_binary(time_binary) {}

string external_time_measurer::name() const {
    return time_binary.string();
}

measured_run external_time_measurer::run(const process_options &opt) {
    // 每次运行使用独立的临时文件，不论解析是否成功都会在离开作用域时删除
    scoped_temp_file time_file("judge_time_");

    process_options wrapped = opt;
    wrapped.command = make_command(time_binary, "-f", "%e %M", "-o", time_file.path(), opt.command);

    measured_run result;
    result.process = run_process(wrapped);
    if (!result.process.timed_out())
        result.usage = read_time_output(time_file.path());
    return result;
}

string rusage_measurer::name() const {
    return "getrusage";
}

measured_run rusage_measurer::run(const process_options &opt) {
    struct rusage before, after;
    bool has_before = getrusage(RUSAGE_CHILDREN, &before) == 0;

    elapsed_time timer;
    measured_run result;
    result.process = run_process(opt);
    result.usage.time_seconds = timer.seconds();

    if (has_before && getrusage(RUSAGE_CHILDREN, &after) == 0) {
        long delta = after.ru_maxrss - before.ru_maxrss;
        result.usage.memory_kb = max(0L, delta > 0 ? delta : after.ru_maxrss);
    }
    return result;
}

unique_ptr<resource_measurer> make_resource_measurer(const fs::path &time_binary) {
    if (!time_binary.empty() && fs::is_regular_file(time_binary) && access(time_binary.c_str(), X_OK) == 0) {
        LOG(INFO) << "Measuring resource usage with " << time_binary;
        return make_unique<external_time_measurer>(time_binary);
    }
    LOG(INFO) << "External time binary " << time_binary << " is not available, falling back to getrusage";
    return make_unique<rusage_measurer>();
}

}  // namespace localjudge
