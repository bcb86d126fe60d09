#include "localjudge/common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace localjudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_code = boost::assign::map_list_of
    (status::ACCEPTED, "AC")
    (status::WRONG_ANSWER, "WA")
    (status::RUNTIME_ERROR, "RE")
    (status::TIME_LIMIT_EXCEEDED, "TLE")
    (status::NO_EXPECTED, "NO_EXPECTED");
// clang-format on

const char *get_status_code(status stat) {
    return status_code.at(stat);
}

}  // namespace localjudge
