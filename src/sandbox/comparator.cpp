#include "sandbox/comparator.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <tuple>
#include <unordered_map>
#include <vector>
#include "common/io_utils.hpp"

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<string, compare_mode> mode_names = boost::assign::map_list_of
    ("exact", compare_mode::EXACT)
    ("fuzzy", compare_mode::FUZZY)
    ("contains", compare_mode::CONTAINS);
// clang-format on

optional<compare_mode> parse_compare_mode(const string &name) {
    auto it = mode_names.find(name);
    if (it == mode_names.end()) return nullopt;
    return it->second;
}

const char *get_mode_name(compare_mode mode) {
    switch (mode) {
        case compare_mode::EXACT: return "exact";
        case compare_mode::FUZZY: return "fuzzy";
        case compare_mode::CONTAINS: return "contains";
    }
    return "unknown";
}

namespace {

struct matching_block {
    int a, b, size;

    bool operator<(const matching_block &other) const {
        return tie(a, b, size) < tie(other.a, other.b, other.size);
    }
};

/**
 * @brief 最长匹配块算法
 * b2j 记录 b 中每个字符出现的位置，出现过于频繁的字符会被剔除。
 */
struct sequence_matcher {
    sequence_matcher(const u32string &a, const u32string &b) : a(a), b(b) {
        for (int j = 0; j < (int)b.size(); ++j)
            b2j[b[j]].push_back(j);

        int n = b.size();
        if (n >= 200) {
            size_t ntest = n / 100 + 1;
            for (auto it = b2j.begin(); it != b2j.end();) {
                if (it->second.size() > ntest)
                    it = b2j.erase(it);
                else
                    ++it;
            }
        }
    }

    matching_block find_longest_match(int alo, int ahi, int blo, int bhi) const {
        int besti = alo, bestj = blo, bestsize = 0;
        unordered_map<int, int> j2len, new_j2len;
        for (int i = alo; i < ahi; ++i) {
            new_j2len.clear();
            auto it = b2j.find(a[i]);
            if (it != b2j.end()) {
                for (int j : it->second) {
                    if (j < blo) continue;
                    if (j >= bhi) break;
                    auto prev = j2len.find(j - 1);
                    int k = new_j2len[j] = (prev == j2len.end() ? 0 : prev->second) + 1;
                    if (k > bestsize) {
                        besti = i - k + 1;
                        bestj = j - k + 1;
                        bestsize = k;
                    }
                }
            }
            swap(j2len, new_j2len);
        }

        // 被剔除的高频字符不能作为起点，但可以向两侧扩展
        while (besti > alo && bestj > blo && a[besti - 1] == b[bestj - 1]) {
            --besti;
            --bestj;
            ++bestsize;
        }
        while (besti + bestsize < ahi && bestj + bestsize < bhi && a[besti + bestsize] == b[bestj + bestsize])
            ++bestsize;
        return {besti, bestj, bestsize};
    }

    vector<matching_block> get_matching_blocks() const {
        vector<matching_block> blocks;
        vector<tuple<int, int, int, int>> queue = {{0, (int)a.size(), 0, (int)b.size()}};
        while (!queue.empty()) {
            auto [alo, ahi, blo, bhi] = queue.back();
            queue.pop_back();
            matching_block block = find_longest_match(alo, ahi, blo, bhi);
            if (block.size == 0) continue;
            blocks.push_back(block);
            if (alo < block.a && blo < block.b)
                queue.emplace_back(alo, block.a, blo, block.b);
            if (block.a + block.size < ahi && block.b + block.size < bhi)
                queue.emplace_back(block.a + block.size, ahi, block.b + block.size, bhi);
        }
        sort(blocks.begin(), blocks.end());

        // 合并首尾相接的匹配块
        vector<matching_block> merged;
        for (auto &block : blocks) {
            if (!merged.empty()) {
                auto &last = merged.back();
                if (last.a + last.size == block.a && last.b + last.size == block.b) {
                    last.size += block.size;
                    continue;
                }
            }
            merged.push_back(block);
        }
        return merged;
    }

private:
    const u32string &a, &b;
    unordered_map<char32_t, vector<int>> b2j;
};

string preview(const string &text) {
    if (utf8_length(text) <= PREVIEW_LENGTH) return text;
    return utf8_prefix(text, PREVIEW_LENGTH) + "...";
}

}  // namespace

double similarity_ratio(const string &a, const string &b) {
    u32string sa = utf8_decode(a), sb = utf8_decode(b);
    size_t total = sa.size() + sb.size();
    if (total == 0) return 1.0;

    sequence_matcher matcher(sa, sb);
    size_t matches = 0;
    for (auto &block : matcher.get_matching_blocks())
        matches += block.size;
    return 2.0 * matches / total;
}

comparison_result compare(const string &actual, const string &expected, compare_mode mode) {
    string a = boost::algorithm::trim_copy(actual);
    string e = boost::algorithm::trim_copy(expected);

    comparison_result result;
    result.mode = get_mode_name(mode);
    switch (mode) {
        case compare_mode::EXACT:
            result.matched = a == e;
            if (result.matched) {
                result.similarity = 1.0;
                result.details = "Output matches exactly!";
            } else {
                result.details = fmt::format("Output does not match!\n\nExpected:\n{}\n\nGot:\n{}\n\nSimilarity: {:.1f}%",
                                             preview(e), preview(a), similarity_ratio(a, e) * 100);
            }
            break;
        case compare_mode::FUZZY:
            result.similarity = similarity_ratio(a, e);
            result.matched = result.similarity >= FUZZY_MATCH_THRESHOLD;
            if (result.matched)
                result.details = fmt::format("Output matches with {:.1f}% similarity", result.similarity * 100);
            else
                result.details = fmt::format("Output only {:.1f}% similar. Expected at least {:.0f}%.",
                                             result.similarity * 100, FUZZY_MATCH_THRESHOLD * 100);
            break;
        case compare_mode::CONTAINS:
            result.matched = a.find(e) != string::npos;
            if (result.matched)
                result.details = "Output contains expected text!";
            else
                result.details = fmt::format("Output does not contain expected text: '{}'", e);
            break;
    }
    return result;
}

comparison_result compare(const string &actual, const string &expected, const string &mode) {
    if (auto parsed = parse_compare_mode(mode))
        return compare(actual, expected, *parsed);

    comparison_result result;
    result.mode = mode;
    result.details = "Unknown comparison mode: " + mode;
    return result;
}

}  // namespace sandbox
