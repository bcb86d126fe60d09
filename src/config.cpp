#include "localjudge/config.hpp"

namespace localjudge {
using namespace std;

filesystem::path TIME_BINARY = "/usr/bin/time";
string COMPILER = "g++";
string DEFAULT_SOURCE = "main.cpp";
string DEFAULT_STANDARD = "c++17";
filesystem::path METADATA_PATH;
filesystem::path PROBLEM_DIR;
bool DEBUG = false;

}  // namespace localjudge
