#include <coincidence/selftest.hpp>
#include <coincidence/lcs.hpp>
#include <coincidence/markup.hpp>

#include <algorithm>
#include <exception>
#include <iomanip>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace coincidence {

namespace {

struct LCSCase
{
    std::string_view str1, str2;
    std::vector<std::string_view> expected;
};

struct MarkupCase
{
    std::string_view name;
    std::string (*function)(std::string_view);
    std::string_view input, expected;
};

std::vector<std::string> sorted(SubstringSet<char> const& substrs)
{
    std::vector<std::string> result(substrs.begin(), substrs.end());
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace

size_t SelfTest::run(std::ostream & out)
{
    static LCSCase const lcs_cases[] = {
        {"xydxyaa", "abcdxyz", {"dxy"}},
        {"aaaaaasubstringxxxxxx", "absubstringzzz", {"substring"}},
        {"shorter", "shorterlonger", {"shorter"}},
        {"shorter", "longershorter", {"shorter"}},
        {"xxx123yyyy456zzz", "789zzz012xxx345yyy", {"xxx", "yyy", "zzz"}},
        {"123456", "abcdef", {}},
        {"somestring", "", {}},
    };
    static MarkupCase const markup_cases[] = {
        {"markup_text", markup_text, "<blah><foo><some_text>the article</some_text></foo></blah>", "the article"},
        {"strip_markup", strip_markup, "[[blah]]some text[blah]", "some text"},
        {"strip_markup", strip_markup, "==blah==some text{{blah}}", "some text"},
    };

    size_t failures = 0;

    for (auto & c : lcs_cases) {
        auto actual = sorted(longest_common_substrings(c.str1, c.str2));
        bool ok = std::equal(actual.begin(), actual.end(), c.expected.begin(), c.expected.end());
        out << (ok ? "ok   " : "FAIL ") << "longest_common_substrings("
            << std::quoted(c.str1) << ", " << std::quoted(c.str2) << ") = {";
        for (size_t i = 0; i < actual.size(); ++ i) {
            out << (i ? ", " : "") << std::quoted(actual[i]);
        }
        out << "}\n";
        failures += !ok;
    }

    for (auto & c : markup_cases) {
        std::string actual;
        bool ok;
        try {
            actual = c.function(c.input);
            ok = actual == c.expected;
        } catch (std::exception const& e) {
            actual = e.what();
            ok = false;
        }
        out << (ok ? "ok   " : "FAIL ") << c.name << "(" << std::quoted(c.input) << ") = " << std::quoted(actual) << "\n";
        failures += !ok;
    }

    size_t total = std::size(lcs_cases) + std::size(markup_cases);
    out << (total - failures) << "/" << total << " passed" << std::endl;
    return failures;
}

} // namespace coincidence
