#ifndef EXTRACT_HPP
#define EXTRACT_HPP

#include <string>
#include <regex>

#include "struc.hpp"

#define CSS_NAME "[a-zA-Z_-][a-zA-Z0-9_-]*"
#define JS_NAME  "[a-zA-Z_$][a-zA-Z0-9_$]*"

extern const std::regex re_css_class;
extern const std::regex re_css_id;
extern const std::regex re_js_function;
extern const std::regex re_js_var;

// comments
std::string strip_block_comments(std::string const& in);
std::string strip_line_comments(std::string const& in);

// candidates
selector_set extract_css_selectors(std::string const& text);
identifier_set extract_js_identifiers(std::string const& text);

#endif //EXTRACT_HPP
