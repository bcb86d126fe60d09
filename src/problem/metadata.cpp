#include "localjudge/problem/metadata.hpp"
#include <glog/logging.h>
#include "localjudge/common/io_utils.hpp"
#include "localjudge/common/json_utils.hpp"

namespace localjudge {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static string directory_name(const fs::path &dir) {
    fs::path name = dir.filename();
    if (name.empty()) name = dir.parent_path().filename();  // 以 / 结尾的路径
    return name.string();
}

problem_record parse_problem_record(const json &j) {
    problem_record record;
    record.pid = get_value_def<string>(j, "", "pid");
    record.directory = get_value_def<string>(j, "", "directory");
    record.limits.time_limit_ms = get_number_optional<double>(j, "time_limit_ms");
    record.limits.memory_limit_kb = get_number_optional<long>(j, "memory_limit_kb");
    record.time_limit_human = get_value_def<string>(j, "", "time_limit_human");
    record.memory_limit_human = get_value_def<string>(j, "", "memory_limit_human");
    return record;
}

metadata_store::metadata_store() {}

metadata_store::metadata_store(map<string, problem_record> records)
    : records(move(records)) {}

metadata_store metadata_store::load(const fs::path &path) {
    if (!fs::is_regular_file(path)) {
        LOG(INFO) << "Metadata file " << path << " does not exist";
        return metadata_store();
    }

    try {
        return from_json(json::parse(read_file_content(path)));
    } catch (json::exception &e) {
        LOG(WARNING) << "Metadata file " << path << " is malformed: " << e.what();
        return metadata_store();
    }
}

metadata_store metadata_store::from_json(const json &catalog) {
    map<string, problem_record> records;
    if (!catalog.is_object()) {
        LOG(WARNING) << "Metadata should be a JSON object keyed by problem id";
        return metadata_store();
    }
    for (auto &[key, value] : catalog.items()) {
        if (!value.is_object() || value.empty()) continue;
        records.emplace(key, parse_problem_record(value));
    }
    return metadata_store(move(records));
}

optional<problem_record> metadata_store::find_by_pid(const string &pid) const {
    if (auto it = records.find(pid); it != records.end())
        return it->second;
    for (auto &[key, record] : records)
        if (record.pid == pid)
            return record;
    return nullopt;
}

optional<problem_record> metadata_store::find_by_directory(const fs::path &dir) const {
    string name = directory_name(dir);
    if (auto it = records.find(name); it != records.end()) {
        const problem_record &record = it->second;
        if (record.directory.empty() || directory_name(record.directory) == name)
            return record;
    }
    for (auto &[key, record] : records)
        if (!record.directory.empty() && directory_name(record.directory) == name)
            return record;
    return nullopt;
}

size_t metadata_store::size() const {
    return records.size();
}

problem_location resolve_problem_directory(const string &pid, const fs::path &base_dir, const metadata_store &metadata) {
    problem_location location;
    location.record = metadata.find_by_pid(pid);
    if (location.record && !location.record->directory.empty()) {
        fs::path candidate = base_dir / location.record->directory;
        if (fs::exists(candidate)) {
            location.dir = candidate;
            return location;
        }
    }
    location.dir = base_dir / pid;
    return location;
}

}  // namespace localjudge
