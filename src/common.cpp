#include <coincidence/common.hpp>

#include <algorithm>
#include <cctype>

namespace coincidence {

std::string_view trim(std::string_view str)
{
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c){return std::isspace(c);});
    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c){return std::isspace(c);}).base();
    return start < end ? std::string_view(&*start, (size_t)(end - start)) : std::string_view();
}

std::string_view last_segment(std::string_view str, char separator)
{
    size_t off = str.rfind(separator);
    if (off == std::string_view::npos) {
        return str;
    }
    return str.substr(off + 1);
}

} // namespace coincidence
