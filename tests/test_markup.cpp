#define BOOST_TEST_MODULE MarkupTest
#include <boost/test/unit_test.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <coincidence/markup.hpp>

#include <sstream>
#include <string>
#include <stdexcept>

using namespace coincidence;

BOOST_AUTO_TEST_CASE(test_parse) {
    // Test the parsing mechanism, but don't recreate Wikipedia XML.
    BOOST_TEST(markup_text("<blah><foo><some_text>the article</some_text></foo></blah>") == "the article");
}

BOOST_AUTO_TEST_CASE(test_parse_stream) {
    std::istringstream response("<blah><foo><some_text>the article</some_text></foo></blah>");
    BOOST_TEST(markup_text(response) == "the article");
}

BOOST_AUTO_TEST_CASE(test_parse_first_in_document_order) {
    // a nested match earlier in the document wins over a later shallow one
    const std::string_view input =
        "<root><a><b><first_text>one</first_text></b></a><second_text>two</second_text></root>";
    BOOST_TEST(markup_text(input) == "one");
}

BOOST_AUTO_TEST_CASE(test_parse_ignores_attributes) {
    const std::string_view input = R"(<root context="x"><page><text lang="en">body</text></page></root>)";
    BOOST_TEST(markup_text(input) == "body");
}

BOOST_AUTO_TEST_CASE(test_parse_preserves_whitespace) {
    BOOST_TEST(markup_text("<text>  two\nlines  </text>") == "  two\nlines  ");
}

BOOST_AUTO_TEST_CASE(test_parse_entities) {
    BOOST_TEST(markup_text("<text>a &lt;b&gt; &amp; c</text>") == "a <b> & c");
}

BOOST_AUTO_TEST_CASE(test_parse_empty_text) {
    BOOST_TEST(markup_text("<page><text/></page>") == "");
}

BOOST_AUTO_TEST_CASE(test_parse_missing_text) {
    BOOST_CHECK_THROW(markup_text("<page><title>Walrus</title></page>"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_parse_invalid_xml) {
    BOOST_CHECK_THROW(markup_text("<page><text>unterminated"), boost::property_tree::xml_parser_error);
}

BOOST_AUTO_TEST_CASE(test_strip_markup_self) {
    BOOST_TEST(strip_markup("[[blah]]some text[blah]") == "some text");
    BOOST_TEST(strip_markup("==blah==some text{{blah}}") == "some text");
}

BOOST_AUTO_TEST_CASE(test_strip_markup_plain) {
    BOOST_TEST(strip_markup("") == "");
    BOOST_TEST(strip_markup("no markup here") == "no markup here");
    BOOST_TEST(strip_markup("single = sign, {brace} and ]stray[") == "single = sign, {brace} and ]stray[");
}

BOOST_AUTO_TEST_CASE(test_strip_markup_multiline) {
    BOOST_TEST(strip_markup("==History==\nThe walrus.[1]\n{{Reflist}}\n") == "\nThe walrus.\n\n");
    // headings and links may span lines
    BOOST_TEST(strip_markup("a[[b\nc]]d") == "ad");
}

BOOST_AUTO_TEST_CASE(test_strip_markup_single_pass) {
    // only the innermost bracket pair matches; what it exposes is not rescanned
    BOOST_TEST(strip_markup("[[a [b] c]]") == "[[a  c]]");
    BOOST_TEST(strip_markup("{{a {{b}} c}}") == "{{a  c}}");
    BOOST_TEST(strip_markup("===Sub===") == "==");
}

BOOST_AUTO_TEST_CASE(test_strip_markup_unbalanced) {
    BOOST_TEST(strip_markup("{{unclosed") == "{{unclosed");
    BOOST_TEST(strip_markup("[[unclosed]") == "[");
}

BOOST_AUTO_TEST_CASE(test_strip_markup_long_unclosed) {
    // article-sized text after an unclosed opener must not exhaust the stack
    std::string tail(200000, 'x');
    BOOST_TEST(strip_markup("a == b " + tail) == "a == b " + tail);
    BOOST_TEST(strip_markup("a [ b " + tail) == "a [ b " + tail);
    BOOST_TEST(strip_markup("a {{ b " + tail) == "a {{ b " + tail);
    BOOST_TEST(strip_markup("a ==" + tail + "== b") == "a  b");
}
