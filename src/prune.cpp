#include "prune.hpp"

#include <regex>

/** CSS **/

std::string clean_selector(std::string const& in)
{
  std::string ret=trim(in);
  size_t i=ret.find(':');
  if(i != std::string::npos)
    ret.erase(i);
  return ret;
}

bool has_used_selector(std::vector<std::string> const& selectors, std::set<std::string> const& unused)
{
  for(auto sel: selectors)
  {
    std::string clean=clean_selector(sel);
    bool covered=false;
    for(auto it: unused)
    {
      if(clean.find(it) != std::string::npos)
      {
        covered=true;
        break;
      }
    }
    if(!covered)
      return true;
  }
  return false;
}

inline bool contains_any(std::string const& line, std::set<std::string> const& names)
{
  for(auto it: names)
  {
    if(line.find(it) != std::string::npos)
      return true;
  }
  return false;
}

std::string remove_unused_css_rules(std::string const& text, std::set<std::string> const& unused)
{
  if(unused.size() <= 0)
    return text;

  std::vector<std::string> lines=split_lines(text);
  std::vector<std::string> ret;
  bool in_rule=false;
  bool rule_used=false;
  int32_t depth=0;
  std::vector<std::string> rule_selectors;

  for(auto line: lines)
  {
    int32_t balance = (int32_t) count_char(line, '{') - (int32_t) count_char(line, '}');
    if(!in_rule && line.find('{') != std::string::npos)
    {
      // rule opening
      rule_selectors.clear();
      for(auto it: split_fields(line.substr(0, line.find('{')), ','))
        rule_selectors.push_back(trim(it));
      rule_used=has_used_selector(rule_selectors, unused);
      depth=balance;
      in_rule = depth > 0;

      if(rule_used)
        ret.push_back(line);
    }
    else if(in_rule)
    {
      depth += balance;
      if(depth <= 0)
      {
        // closing line
        in_rule=false;
        if(rule_used)
          ret.push_back(line);
      }
      else if(rule_used && !contains_any(line, unused))
        ret.push_back(line);
      // body of a deleted rule goes with it
    }
    else
      ret.push_back(line);
  }

  return join(ret, '\n');
}

/** JS **/

std::vector<std::regex> js_declaration_regexes(std::string const& name)
{
  std::string ename=regex_escape(name);
  return {
    std::regex("^\\s*function\\s+" + ename + "\\s*\\("),
    std::regex("^\\s*(?:var|let|const)\\s+" + ename + "\\s*[=;]"),
  };
}

bool is_js_declaration_line(std::string const& line, std::string const& name)
{
  for(auto const& re: js_declaration_regexes(name))
  {
    if(std::regex_search(line, re))
      return true;
  }
  return false;
}

std::string remove_unused_js_code(std::string const& text, std::set<std::string> const& unused)
{
  if(unused.size() <= 0)
    return text;

  std::vector<std::regex> decls;
  for(auto it: unused)
  {
    auto t = js_declaration_regexes(it);
    decls.insert(decls.end(), t.begin(), t.end());
  }

  std::vector<std::string> ret;
  for(auto line: split_lines(text))
  {
    bool remove=false;
    for(auto const& re: decls)
    {
      if(std::regex_search(line, re))
      {
        remove=true;
        break;
      }
    }
    // only the declaration line goes, a function body is left in place
    if(!remove)
      ret.push_back(line);
  }

  return join(ret, '\n');
}
