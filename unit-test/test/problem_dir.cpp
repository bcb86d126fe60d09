#include "test/problem_dir.hpp"
#include <fstream>
#include <stdexcept>
#include "localjudge/run/process.hpp"
#include "localjudge/common/utils.hpp"

namespace localjudge::test {
using namespace std;
namespace fs = std::filesystem;

problem_dir::problem_dir()
    : dir("judge_test_") {}

const fs::path &problem_dir::path() const {
    return dir.path();
}

fs::path problem_dir::write(const string &filename, const string &content) const {
    fs::path file = dir.path() / filename;
    ofstream fout(file, ios::binary | ios::trunc);
    if (!fout) throw runtime_error("unable to write " + file.string());
    fout << content;
    return file;
}

fs::path write_script(const fs::path &path, const string &body) {
    {
        ofstream fout(path, ios::trunc);
        if (!fout) throw runtime_error("unable to write " + path.string());
        fout << "#!/bin/sh" << endl
             << body << endl;
    }
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return path;
}

bool has_compiler() {
    static bool found = [] {
        process_options opt;
        opt.command = make_command("g++", "--version");
        opt.wall_limit = 10;
        try {
            return run_process(opt).exitcode == 0;
        } catch (system_error &) {
            return false;
        }
    }();
    return found;
}

}  // namespace localjudge::test
