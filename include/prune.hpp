#ifndef PRUNE_HPP
#define PRUNE_HPP

#include <string>
#include <vector>
#include <set>

#include "struc.hpp"
#include "util.hpp"

// selector text without pseudo-classes/elements
std::string clean_selector(std::string const& in);
// true if at least one selector contains none of the unused names
bool has_used_selector(std::vector<std::string> const& selectors, std::set<std::string> const& unused);

std::string remove_unused_css_rules(std::string const& text, std::set<std::string> const& unused);
inline std::string remove_unused_css_rules(std::string const& text, selector_set const& unused) {
  return remove_unused_css_rules(text, to_strings(unused));
}

bool is_js_declaration_line(std::string const& line, std::string const& name);

std::string remove_unused_js_code(std::string const& text, std::set<std::string> const& unused);
inline std::string remove_unused_js_code(std::string const& text, identifier_set const& unused) {
  return remove_unused_js_code(text, to_strings(unused));
}

#endif //PRUNE_HPP
