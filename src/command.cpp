#include <coincidence/command.hpp>
#include <coincidence/configuration.hpp>
#include <coincidence/lcs.hpp>
#include <coincidence/log.hpp>
#include <coincidence/selftest.hpp>
#include <coincidence/wikipedia.hpp>

#include <algorithm>
#include <exception>
#include <iomanip>
#include <string>
#include <vector>

namespace coincidence {

Command::Command(std::ostream & out, std::ostream & err)
: self_test(SelfTest::run)
, out_(out)
, err_(err)
{ }

void Command::usage(std::ostream & out, std::string_view argv0) {
    out << "Usage: " << argv0 << " [-h|-t]" << std::endl
        << std::endl
        << "Find the longest common substring in two random Wikipedia articles." << std::endl
        << std::endl
        << "Options:" << std::endl
        << "  -h, --help  show this help message and exit" << std::endl
        << "  -t, --test  Test this program" << std::endl;
}

int Command::run(std::span<std::string_view const> args) {
    std::string_view argv0 = args.empty() ? "coincidence" : args[0];
    bool test = false;
    for (size_t i = 1; i < args.size(); ++ i) {
        std::string_view arg = args[i];
        if (arg == "-h" || arg == "--help") {
            usage(out_, argv0);
            return 0;
        } else if (arg == "-t" || arg == "--test") {
            test = true;
        } else {
            usage(err_, argv0);
            err_ << std::endl << argv0 << ": error: no such option: " << arg << std::endl;
            return 2;
        }
    }

    if (test) {
        return self_test(out_) == 0 ? 0 : 1;
    }

    return compare_random_articles();
}

int Command::compare_random_articles() {
    // To find more interesting substrings, the articles are filtered of as much boilerplate as possible.
    out_ << "Requesting two random Wikipedia articles..." << std::endl;
    std::vector<Article> articles;
    try {
        Configuration config(coincidence::span<std::string_view>({"coincidence.ini"}), !Configuration::has_local());
        articles = Wikipedia::from(config).random_articles(2);
    } catch (std::exception const& e) {
        Log::log(coincidence::span<StringViewPair>({
            {"event", "error"},
            {"what", e.what()},
        }));
        err_ << std::endl << "Error: Unable to retrieve articles, " << e.what() << std::endl;
        return 1;
    }

    for (auto & article : articles) {
        out_ << "  Title: " << article.title << std::endl;
        Log::log(coincidence::span<StringViewPair>({
            {"event", "article"},
            {"title", article.title},
        }));
    }

    out_ << "Computing longest common sequence(s) in articles..." << std::endl;

    std::vector<std::string> texts;
    try {
        for (auto & article : articles) {
            texts.emplace_back(article.text());
        }
    } catch (std::exception const& e) {
        Log::log(coincidence::span<StringViewPair>({
            {"event", "error"},
            {"what", e.what()},
        }));
        err_ << std::endl << "Error: Unable to read articles, " << e.what() << std::endl;
        return 1;
    }

    auto substrs = longest_common_substrings_utf8(texts[0], texts[1]);
    std::vector<std::string> sorted(substrs.begin(), substrs.end());
    std::sort(sorted.begin(), sorted.end());

    std::string count = std::to_string(sorted.size());
    std::string length = std::to_string(sorted.empty() ? 0 : sorted.front().size());
    Log::log(coincidence::span<StringViewPair>({
        {"event", "result"},
        {"count", count},
        {"length", length},
    }));

    if (sorted.empty()) {
        out_ << "No common substring found." << std::endl;
    }
    for (auto & seq : sorted) {
        out_ << "sequence: " << std::quoted(seq) << std::endl;
    }

    return 0;
}

} // namespace coincidence
