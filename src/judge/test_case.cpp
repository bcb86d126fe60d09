#include "localjudge/judge/test_case.hpp"
#include <algorithm>

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;

vector<test_case> list_tests(const fs::path &dir) {
    vector<test_case> tests;
    for (auto &entry : fs::directory_iterator(dir)) {
        const fs::path &path = entry.path();
        if (!entry.is_regular_file() || path.extension() != ".in") continue;

        test_case tc;
        tc.name = path.filename().string();
        tc.input_path = path;
        tc.expected_path = fs::path(path).replace_extension(".out");
        tc.expected_available = fs::is_regular_file(tc.expected_path);
        tests.push_back(move(tc));
    }
    sort(tests.begin(), tests.end(), [](const test_case &a, const test_case &b) {
        return a.name < b.name;
    });
    return tests;
}

}  // namespace localjudge
