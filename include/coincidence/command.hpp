#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <span>
#include <string_view>

namespace coincidence {

/*
 * The coincidence command line: fetch two random articles and print their
 * longest common substrings, or run the self test.
 */
class Command {
public:
    Command(std::ostream & out, std::ostream & err);

    /*
     * args[0] is the program name. Returns the process exit status:
     * 0 on success, 1 on a failed self test or retrieval, 2 on a bad option.
     */
    int run(std::span<std::string_view const> args);

    // Replaceable so the exit status of a failing self test can be checked.
    std::function<size_t(std::ostream &)> self_test;

private:
    void usage(std::ostream & out, std::string_view argv0);
    int compare_random_articles();

    std::ostream & out_;
    std::ostream & err_;
};

} // namespace coincidence
