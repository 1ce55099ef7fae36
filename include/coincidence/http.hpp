#pragma once

#include <string>
#include <string_view>

#include <coincidence/common.hpp>

namespace coincidence {

class HTTP {
public:
    using Header = StringViewPair;

    struct Response {
        unsigned status;
        std::string reason;
        std::string location; // Location header, set on redirects
        std::string body;
    };

    // Perform an HTTP GET with custom headers, without following redirects
    static Response request(
        std::string_view url,
        std::span<Header const> headers = {}
    );

    // Perform an HTTP GET with custom headers and return the entire response body as a string
    // Throws std::runtime_error on a non-2xx status
    static std::string request_string(
        std::string_view url,
        std::span<Header const> headers = {}
    );
};

} // namespace coincidence
