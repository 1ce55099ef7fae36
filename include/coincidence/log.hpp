#pragma once

#include <coincidence/common.hpp>

#include <span>

namespace coincidence {

class Log {
public:
    /*
     * Append one JSON object holding the fields and a "ts" timestamp
     * to this launch's file under the logs configuration directory.
     */
    static void log(std::span<StringViewPair const> fields);
};

} // namespace coincidence
