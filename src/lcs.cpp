#include <coincidence/lcs.hpp>

#include <boost/locale/encoding_utf.hpp>

namespace coincidence {

template SubstringSet<char> longest_common_substrings<char>(std::string_view, std::string_view);
template SubstringSet<char32_t> longest_common_substrings<char32_t>(std::u32string_view, std::u32string_view);

SubstringSet<char> longest_common_substrings(std::string_view str1, std::string_view str2)
{
    return longest_common_substrings<char>(str1, str2);
}

SubstringSet<char> longest_common_substrings_utf8(std::string_view str1, std::string_view str2)
{
    using boost::locale::conv::utf_to_utf;

    std::u32string code_points1 = utf_to_utf<char32_t>(str1.data(), str1.data() + str1.size());
    std::u32string code_points2 = utf_to_utf<char32_t>(str2.data(), str2.data() + str2.size());

    SubstringSet<char> result;
    for (auto & substr : longest_common_substrings<char32_t>(code_points1, code_points2)) {
        result.insert(utf_to_utf<char>(substr));
    }
    return result;
}

} // namespace coincidence
