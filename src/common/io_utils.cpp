#include "localjudge/common/io_utils.hpp"
#include <glog/logging.h>
#include <stdlib.h>
#include <unistd.h>
#include <fstream>
#include <system_error>
#include <vector>

namespace localjudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::in | ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::is_regular_file(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

string sanitize_utf8(const string &text) {
    static const char replacement[] = "\xEF\xBF\xBD";
    string result;
    result.reserve(text.size());
    size_t i = 0, ix = text.length();
    while (i < ix) {
        unsigned char c = (unsigned char)text[i];
        size_t n;
        unsigned char lo = 0x80, hi = 0xBF;  // 第二个字节的合法范围
        if (c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if (c >= 0xC2 && c <= 0xDF)
            n = 1;  // 110bbbbb
        else if ((c & 0xF0) == 0xE0) {
            n = 2;  // 1110bbbb
            if (c == 0xE0) lo = 0xA0;  // overlong
            if (c == 0xED) hi = 0x9F;  // U+D800 to U+DFFF
        } else if (c >= 0xF0 && c <= 0xF4) {
            n = 3;  // 11110bbb
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;  // > U+10FFFF
        } else {
            result += replacement;
            ++i;
            continue;
        }

        size_t j = 1;
        for (; j <= n && i + j < ix; ++j) {
            unsigned char d = (unsigned char)text[i + j];
            if (j == 1 ? (d < lo || d > hi) : ((d & 0xC0) != 0x80))
                break;
        }
        if (j == n + 1) {
            result.append(text, i, n + 1);
            i += n + 1;
        } else {
            // 一个不完整的字节序列只替换成一个 U+FFFD
            result += replacement;
            i += j;
        }
    }
    return result;
}

scoped_temp_file::scoped_temp_file(const string &prefix) : valid(false) {
    string templ = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    int fd = mkstemp(buf.data());
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to create temporary file " + templ);
    close(fd);
    file = fs::path(buf.data());
    valid = true;
}

scoped_temp_file::scoped_temp_file(scoped_temp_file &&other) : valid(false) {
    *this = move(other);
}

scoped_temp_file::~scoped_temp_file() {
    release();
}

scoped_temp_file &scoped_temp_file::operator=(scoped_temp_file &&other) {
    swap(valid, other.valid);
    swap(file, other.file);
    return *this;
}

const fs::path &scoped_temp_file::path() const {
    return file;
}

void scoped_temp_file::release() {
    if (!valid) return;
    error_code ec;
    fs::remove(file, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove temporary file " << file << ": " << ec.message();
    valid = false;
}

scoped_temp_directory::scoped_temp_directory(const string &prefix) : valid(false) {
    string templ = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data()))
        throw system_error(errno, system_category(), "unable to create temporary directory " + templ);
    dir = fs::path(buf.data());
    valid = true;
}

scoped_temp_directory::scoped_temp_directory(scoped_temp_directory &&other) : valid(false) {
    *this = move(other);
}

scoped_temp_directory::~scoped_temp_directory() {
    release();
}

scoped_temp_directory &scoped_temp_directory::operator=(scoped_temp_directory &&other) {
    swap(valid, other.valid);
    swap(dir, other.dir);
    return *this;
}

const fs::path &scoped_temp_directory::path() const {
    return dir;
}

void scoped_temp_directory::keep() {
    if (valid) LOG(INFO) << "Keeping directory " << dir;
    valid = false;
}

void scoped_temp_directory::release() {
    if (!valid) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove temporary directory " << dir << ": " << ec.message();
    valid = false;
}

}  // namespace localjudge
