#pragma once

#include <istream>
#include <string>
#include <string_view>

namespace coincidence {

/*
 * Parse an XML document and find the first element, in document order,
 * whose tag ends with "text". Returns that element's character data.
 *
 * Throws std::runtime_error if there is no such element.
 */
std::string markup_text(std::istream & xml);
std::string markup_text(std::string_view xml);

/*
 * Remove wiki markup, e.g. [this], [[that]], {{those}}, ==the other==
 *
 * The contents of these brackets are mostly boilerplate.
 */
std::string strip_markup(std::string_view text);

} // namespace coincidence
