#include "localjudge/judge/checker.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include "localjudge/common/diff.hpp"

namespace localjudge {
using namespace std;

// ASCII 空白字符，包括 \x1c 到 \x1f 这几个分隔符
static const char ascii_spaces[] = " \t\n\r\v\f\x1c\x1d\x1e\x1f";

// UTF-8 编码的 Unicode 空白字符，比如题目输出中常见的不换行空格和全角空格
// clang-format off
static const vector<string> unicode_spaces = {
    "\xC2\x85",                                    // U+0085
    "\xC2\xA0",                                    // U+00A0
    "\xE1\x9A\x80",                                // U+1680
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83",
    "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",  // U+2000 到 U+200A
    "\xE2\x80\xA8", "\xE2\x80\xA9",                 // U+2028, U+2029
    "\xE2\x80\xAF",                                // U+202F
    "\xE2\x81\x9F",                                // U+205F
    "\xE3\x80\x80"                                 // U+3000
};
// clang-format on

vector<string> normalize_output(const string &text) {
    // 输入是合法的 UTF-8，因此按字节替换不会破坏其他字符
    string unified = text;
    for (const string &space : unicode_spaces)
        boost::replace_all(unified, space, " ");

    vector<string> tokens;
    auto is_whitespace = boost::is_any_of(ascii_spaces);
    boost::trim_if(unified, is_whitespace);
    if (unified.empty()) return tokens;
    boost::split(tokens, unified, is_whitespace, boost::token_compress_on);
    return tokens;
}

bool outputs_match(const string &expected, const string &actual) {
    return normalize_output(expected) == normalize_output(actual);
}

verdict classify(int exitcode,
                 bool expected_available,
                 const string &expected_text,
                 const string &actual_text,
                 const string &expected_name) {
    if (exitcode != 0)
        return {status::RUNTIME_ERROR, fmt::format("Runtime error (exit code {})", exitcode)};

    if (!expected_available)
        return {status::NO_EXPECTED, "Expected output missing"};

    if (outputs_match(expected_text, actual_text))
        return {status::ACCEPTED, "Accepted"};

    auto diff = unified_diff(split_lines(expected_text), split_lines(actual_text), expected_name, "program output");
    diff.resize(min(diff.size(), MAX_DIFF_LINES));
    diff.insert(diff.begin(), "Wrong answer");
    return {status::WRONG_ANSWER, boost::algorithm::join(diff, "\n")};
}

/**
 * @brief 以最短的形式输出秒数，整数也保留一位小数，比如 1.0、2.5
 */
static string format_seconds(double seconds) {
    string text = fmt::format("{}", seconds);
    if (text.find_first_of(".eni") == string::npos) text += ".0";
    return text;
}

verdict classify_timeout(double timeout) {
    return {status::TIME_LIMIT_EXCEEDED, fmt::format("Timeout after {} seconds", format_seconds(timeout))};
}

}  // namespace localjudge
