#include <coincidence/markup.hpp>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/regex.hpp>

#include <iterator>
#include <stdexcept>

namespace pt = boost::property_tree;

namespace coincidence {

namespace {

// attributes and comments are stored as children too
bool is_element(std::string const& tag)
{
    return tag != pt::xml_parser::xmlattr<std::string>() && tag != pt::xml_parser::xmlcomment<std::string>();
}

pt::ptree const * find_text(pt::ptree const& node)
{
    for (auto & [tag, child] : node) {
        if (!is_element(tag)) {
            continue;
        }
        if (std::string_view(tag).ends_with("text")) {
            return &child;
        }
        if (auto * found = find_text(child)) {
            return found;
        }
    }
    return nullptr;
}

} // namespace

std::string markup_text(std::istream & xml)
{
    pt::ptree tree;
    pt::read_xml(xml, tree);
    auto * text = find_text(tree);
    if (text == nullptr) {
        throw std::runtime_error("No text element in document");
    }
    return text->data();
}

std::string markup_text(std::string_view xml)
{
    boost::iostreams::stream<boost::iostreams::array_source> iss(xml.data(), xml.size());
    return markup_text(iss);
}

std::string strip_markup(std::string_view text)
{
    // boost::regex does not recurse per character matched
    static boost::regex const markup_rx(
        R"(\[[^\[\]]*\])"       // [brackets]
        R"(|\[\[[^\[\]]*\]\])"  // [[double brackets]]
        R"(|\{\{[^{}]*\}\})"    // {{double braces}}
        R"(|==[^=]*==)"         // ==equal signs==
    );
    std::string stripped;
    boost::regex_replace(std::back_inserter(stripped), text.begin(), text.end(), markup_rx, "");
    return stripped;
}

} // namespace coincidence
