#include "reference.hpp"

#include "util.hpp"

#define QUOTE "[\"']"

std::vector<std::string> css_attribute_patterns(selector const& sel)
{
  if(sel.kind == selector::css_class)
    return { "class\\s*=\\s*" QUOTE, "className\\s*=\\s*" QUOTE };
  return {};
}

std::vector<std::string> css_reference_patterns(selector const& sel)
{
  std::string name=regex_escape(sel.name);
  if(sel.kind == selector::css_class)
  {
    return {
      "classList\\.(?:add|remove|toggle|contains)\\s*\\(\\s*" QUOTE + name + QUOTE,
    };
  }
  else
  {
    return {
      "id\\s*=\\s*" QUOTE + name + QUOTE,
      "getElementById\\s*\\(\\s*" QUOTE + name + QUOTE,
      "querySelector\\s*\\(\\s*" QUOTE "#" + name + QUOTE,
    };
  }
}

std::vector<std::string> js_reference_patterns(identifier const& id)
{
  std::string name=regex_escape(id.name);
  return {
    "\\b" + name + "\\s*\\(",         // call
    "\\b" + name + "\\b(?!\\s*[=:])", // usage, not an assignment
  };
}

inline bool is_js_namechar(char c)
{
  return is_alphanum(c) || c == '_' || c == '$';
}

bool is_declaration_site(std::string const& text, size_t pos)
{
  size_t i=pos;
  while(i>0 && is_space(text[i-1]))
    i--;
  if(i == pos)
    return false;
  size_t end=i;
  while(i>0 && is_js_namechar(text[i-1]))
    i--;
  std::string word=text.substr(i, end-i);
  return word == "function" || word == "var" || word == "let" || word == "const";
}

bool attribute_contains(std::string const& corpus, std::regex const& opening, std::regex const& word)
{
  for(auto m=std::sregex_iterator(corpus.begin(), corpus.end(), opening); m!=std::sregex_iterator(); m++)
  {
    size_t start=m->position(0) + m->length(0);
    size_t end=corpus.find_first_of("\"'", start);
    // unterminated value: no later opening can close either
    if(end == std::string::npos)
      return false;
    if(std::regex_search(corpus.begin()+start, corpus.begin()+end, word))
      return true;
  }
  return false;
}

bool is_css_referenced(std::string const& corpus, selector const& sel)
{
  std::regex word("\\b" + regex_escape(sel.name) + "\\b", std::regex::ECMAScript | std::regex::icase);
  for(auto it: css_attribute_patterns(sel))
  {
    if(attribute_contains(corpus, std::regex(it, std::regex::ECMAScript | std::regex::icase), word))
      return true;
  }
  for(auto it: css_reference_patterns(sel))
  {
    if(std::regex_search(corpus, std::regex(it, std::regex::ECMAScript | std::regex::icase)))
      return true;
  }
  return false;
}

bool is_js_referenced(std::string const& corpus, identifier const& id)
{
  for(auto it: js_reference_patterns(id))
  {
    std::regex re(it);
    for(auto m=std::sregex_iterator(corpus.begin(), corpus.end(), re); m!=std::sregex_iterator(); m++)
    {
      // a declaration is not a use of itself
      if(!is_declaration_site(corpus, m->position(0)))
        return true;
    }
  }
  return false;
}

selector_set find_css_references(std::string const& corpus, selector_set const& selectors)
{
  selector_set ret;
  for(auto it: selectors)
  {
    if(is_css_referenced(corpus, it))
      ret.insert(it);
  }
  return ret;
}

identifier_set find_js_references(std::string const& corpus, identifier_set const& identifiers)
{
  identifier_set ret;
  for(auto it: identifiers)
  {
    if(is_js_referenced(corpus, it))
      ret.insert(it);
  }
  return ret;
}
