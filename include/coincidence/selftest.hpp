#pragma once

#include <ostream>

namespace coincidence {

class SelfTest {
public:
    /*
     * Check longest_common_substrings and the markup helpers against
     * known answers, reporting one line per case to out.
     *
     * Returns the number of failed cases.
     */
    static size_t run(std::ostream & out);
};

} // namespace coincidence
