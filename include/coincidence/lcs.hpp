#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include <sys/types.h>

namespace coincidence {

/*
 * Longest common substrings by dynamic programming.
 *
 * Every character of one string is checked against every character of the
 * other, so the runtime is O(len(str1) * len(str2)).
 *
 * Only the non-zero cells of the current and previous rows of the matrix are
 * kept. In the worst case, strings of similar length sharing a long common
 * substring, memory use is roughly twice the combined length of the strings.
 *
 * A generalized suffix tree would reach O(len(str1) + len(str2)) time at the
 * cost of much more memory and a more complicated algorithm (Gusfield 1999).
 */

namespace detail {

// Non-zero run lengths of one matrix row, keyed by column.
class SparseRow
{
public:
    // Columns that were never set, including column -1, hold zero.
    size_t operator()(ssize_t column) const
    {
        if (column < 0) {
            return 0;
        }
        auto it = runs_.find((size_t)column);
        return it == runs_.end() ? 0 : it->second;
    }

    void set(size_t column, size_t run)
    {
        runs_[column] = run;
    }

    size_t size() const { return runs_.size(); }

private:
    std::unordered_map<size_t, size_t> runs_;
};

} // namespace detail

template <typename CharT>
using SubstringSet = std::unordered_set<std::basic_string<CharT>>;

template <typename CharT>
SubstringSet<CharT> longest_common_substrings(
    std::basic_string_view<CharT> str1,
    std::basic_string_view<CharT> str2
)
{
    // The shorter string is the horizontal (inner) one so a row holds at most len(h_str) entries.
    std::basic_string_view<CharT> h_str = str1, v_str = str2;
    if (str2.size() < str1.size()) {
        h_str = str2;
        v_str = str1;
    }

    detail::SparseRow prev_row, row;
    SubstringSet<CharT> longest_strings;
    size_t max_length_seen = 0;

    for (CharT v_char : v_str) {
        for (size_t i = 0; i < h_str.size(); ++ i) {
            if (h_str[i] != v_char) {
                continue;
            }

            size_t common_str_len = prev_row((ssize_t)i - 1) + 1;
            row.set(i, common_str_len);

            if (common_str_len < max_length_seen) {
                continue;
            }

            std::basic_string<CharT> common_substr(h_str.substr(i + 1 - common_str_len, common_str_len));

            if (common_str_len == max_length_seen) {
                longest_strings.insert(std::move(common_substr));
            } else {
                // a new record replaces every shorter result
                max_length_seen = common_str_len;
                longest_strings.clear();
                longest_strings.insert(std::move(common_substr));
            }
        }

        prev_row = std::move(row);
        row = {};
    }

    return longest_strings;
}

extern template SubstringSet<char> longest_common_substrings<char>(std::string_view, std::string_view);
extern template SubstringSet<char32_t> longest_common_substrings<char32_t>(std::u32string_view, std::u32string_view);

// Byte-wise comparison.
SubstringSet<char> longest_common_substrings(std::string_view str1, std::string_view str2);

/*
 * Compare UTF-8 texts code point by code point, so a match never starts or
 * ends inside a multi-byte character. Results are encoded back to UTF-8.
 * Invalid sequences in the input are skipped.
 */
SubstringSet<char> longest_common_substrings_utf8(std::string_view str1, std::string_view str2);

} // namespace coincidence
