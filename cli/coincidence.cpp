#include <coincidence/command.hpp>

#include <iostream>
#include <string_view>
#include <vector>

using namespace std;
using namespace coincidence;

int main(int argc, char **argv) {
    vector<string_view> args(argv, argv + argc);
    return Command(cout, cerr).run(args);
}
