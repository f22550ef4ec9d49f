#ifndef REFERENCE_HPP
#define REFERENCE_HPP

#include <string>
#include <vector>
#include <regex>

#include "struc.hpp"

// attribute openings, the quoted value that follows is searched for the word-bounded name
std::vector<std::string> css_attribute_patterns(selector const& sel);
// patterns, in the order they are tried
std::vector<std::string> css_reference_patterns(selector const& sel);
std::vector<std::string> js_reference_patterns(identifier const& id);

// true if the name at pos directly follows a function/var/let/const keyword
bool is_declaration_site(std::string const& text, size_t pos);

// true if a value opened by `opening` and closed by the next quote contains `word`
bool attribute_contains(std::string const& corpus, std::regex const& opening, std::regex const& word);

bool is_css_referenced(std::string const& corpus, selector const& sel);
bool is_js_referenced(std::string const& corpus, identifier const& id);

selector_set find_css_references(std::string const& corpus, selector_set const& selectors);
identifier_set find_js_references(std::string const& corpus, identifier_set const& identifiers);

#endif //REFERENCE_HPP
