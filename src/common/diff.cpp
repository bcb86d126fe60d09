#include "localjudge/common/diff.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cstdint>
#include <utility>

namespace localjudge {
using namespace std;

using kind = diff_opcode::kind;

// LCS 表格的最大规模，超过后中间部分不再对齐
static const size_t MAX_LCS_CELLS = 1 << 22;

static size_t saturating_sub(size_t x, size_t n) {
    return x > n ? x - n : 0;
}

vector<string> split_lines(const string &text) {
    vector<string> lines;
    size_t start = 0, i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\n' || c == '\r') {
            lines.push_back(text.substr(start, i - start));
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
            start = ++i;
        } else {
            ++i;
        }
    }
    if (start < text.size()) lines.push_back(text.substr(start));
    return lines;
}

/**
 * @brief 找出 a 和 b 中相同的行，返回递增的 (a 下标, b 下标) 序列
 */
static vector<pair<size_t, size_t>> match_lines(const vector<string> &a, const vector<string> &b) {
    vector<pair<size_t, size_t>> matches;
    size_t n = a.size(), m = b.size();

    size_t prefix = 0;
    while (prefix < n && prefix < m && a[prefix] == b[prefix]) {
        matches.emplace_back(prefix, prefix);
        ++prefix;
    }

    size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix && a[n - 1 - suffix] == b[m - 1 - suffix])
        ++suffix;

    size_t rn = n - prefix - suffix, rm = m - prefix - suffix;
    if (rn > 0 && rm > 0 && rn <= MAX_LCS_CELLS / rm) {
        // lcs(i, j) 是 a[prefix + i, ...) 与 b[prefix + j, ...) 在中间部分的最长公共子序列长度
        vector<uint32_t> lcs((rn + 1) * (rm + 1), 0);
        auto at = [&](size_t i, size_t j) -> uint32_t & { return lcs[i * (rm + 1) + j]; };
        for (size_t i = rn; i-- > 0;)
            for (size_t j = rm; j-- > 0;)
                at(i, j) = a[prefix + i] == b[prefix + j]
                               ? at(i + 1, j + 1) + 1
                               : max(at(i + 1, j), at(i, j + 1));

        size_t i = 0, j = 0;
        while (i < rn && j < rm) {
            if (a[prefix + i] == b[prefix + j]) {
                matches.emplace_back(prefix + i, prefix + j);
                ++i, ++j;
            } else if (at(i + 1, j) >= at(i, j + 1)) {
                ++i;
            } else {
                ++j;
            }
        }
    }

    for (size_t k = suffix; k > 0; --k)
        matches.emplace_back(n - k, m - k);
    return matches;
}

static void push_change(vector<diff_opcode> &ops, size_t i, size_t ai, size_t j, size_t bj) {
    if (i < ai && j < bj)
        ops.push_back({kind::REPLACE, i, ai, j, bj});
    else if (i < ai)
        ops.push_back({kind::DELETE, i, ai, j, bj});
    else if (j < bj)
        ops.push_back({kind::INSERT, i, ai, j, bj});
}

vector<diff_opcode> diff_lines(const vector<string> &a, const vector<string> &b) {
    vector<diff_opcode> ops;
    auto matches = match_lines(a, b);
    size_t i = 0, j = 0, k = 0;
    while (k < matches.size()) {
        auto [ai, bj] = matches[k];
        push_change(ops, i, ai, j, bj);

        size_t len = 1;
        while (k + len < matches.size() &&
               matches[k + len].first == ai + len &&
               matches[k + len].second == bj + len)
            ++len;
        ops.push_back({kind::EQUAL, ai, ai + len, bj, bj + len});

        i = ai + len, j = bj + len, k += len;
    }
    push_change(ops, i, a.size(), j, b.size());
    return ops;
}

/**
 * @brief 将编辑操作按差异块分组，每组前后最多保留 n 行相同内容
 */
static vector<vector<diff_opcode>> group_opcodes(vector<diff_opcode> codes, size_t n) {
    if (codes.empty()) codes.push_back({kind::EQUAL, 0, 1, 0, 1});

    auto &first = codes.front();
    if (first.tag == kind::EQUAL) {
        first.a_begin = max(first.a_begin, saturating_sub(first.a_end, n));
        first.b_begin = max(first.b_begin, saturating_sub(first.b_end, n));
    }
    auto &last = codes.back();
    if (last.tag == kind::EQUAL) {
        last.a_end = min(last.a_end, last.a_begin + n);
        last.b_end = min(last.b_end, last.b_begin + n);
    }

    vector<vector<diff_opcode>> groups;
    vector<diff_opcode> group;
    for (diff_opcode op : codes) {
        if (op.tag == kind::EQUAL && op.a_end - op.a_begin > n + n) {
            group.push_back({kind::EQUAL, op.a_begin, min(op.a_end, op.a_begin + n),
                             op.b_begin, min(op.b_end, op.b_begin + n)});
            groups.push_back(move(group));
            group.clear();
            op.a_begin = max(op.a_begin, saturating_sub(op.a_end, n));
            op.b_begin = max(op.b_begin, saturating_sub(op.b_end, n));
        }
        group.push_back(op);
    }
    if (!group.empty() && !(group.size() == 1 && group[0].tag == kind::EQUAL))
        groups.push_back(move(group));
    return groups;
}

static string format_range(size_t start, size_t stop) {
    size_t beginning = start + 1;
    size_t length = stop - start;
    if (length == 1) return fmt::format("{}", beginning);
    if (!length) --beginning;  // 空区间显示为插入位置之前的一行
    return fmt::format("{},{}", beginning, length);
}

vector<string> unified_diff(const vector<string> &a,
                            const vector<string> &b,
                            const string &fromfile,
                            const string &tofile,
                            size_t context) {
    vector<string> result;
    for (auto &group : group_opcodes(diff_lines(a, b), context)) {
        if (result.empty()) {
            result.push_back("--- " + fromfile);
            result.push_back("+++ " + tofile);
        }

        const diff_opcode &first = group.front(), &last = group.back();
        result.push_back(fmt::format("@@ -{} +{} @@",
                                     format_range(first.a_begin, last.a_end),
                                     format_range(first.b_begin, last.b_end)));

        for (const diff_opcode &op : group) {
            if (op.tag == kind::EQUAL) {
                for (size_t i = op.a_begin; i < op.a_end; ++i)
                    result.push_back(" " + a[i]);
                continue;
            }
            if (op.tag == kind::REPLACE || op.tag == kind::DELETE)
                for (size_t i = op.a_begin; i < op.a_end; ++i)
                    result.push_back("-" + a[i]);
            if (op.tag == kind::REPLACE || op.tag == kind::INSERT)
                for (size_t j = op.b_begin; j < op.b_end; ++j)
                    result.push_back("+" + b[j]);
        }
    }
    return result;
}

}  // namespace localjudge
