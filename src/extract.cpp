#include "extract.hpp"

const std::regex re_css_class("\\.(" CSS_NAME ")");
const std::regex re_css_id("#(" CSS_NAME ")");
const std::regex re_js_function("function\\s+(" JS_NAME ")");
const std::regex re_js_var("(?:var|let|const)\\s+(" JS_NAME ")");

std::string strip_block_comments(std::string const& in)
{
  std::string ret;
  size_t i=0;
  while(i<in.size())
  {
    size_t start=in.find("/*", i);
    if(start == std::string::npos)
      break;
    size_t end=in.find("*/", start+2);
    // unterminated: nothing left to strip
    if(end == std::string::npos)
      break;
    ret += in.substr(i, start-i);
    i = end+2;
  }
  if(i<in.size())
    ret += in.substr(i);
  return ret;
}

std::string strip_line_comments(std::string const& in)
{
  std::string ret;
  size_t i=0;
  while(i<in.size())
  {
    size_t start=in.find("//", i);
    if(start == std::string::npos)
      break;
    ret += in.substr(i, start-i);
    i = in.find('\n', start);
    if(i == std::string::npos)
      return ret;
  }
  if(i<in.size())
    ret += in.substr(i);
  return ret;
}

selector_set extract_css_selectors(std::string const& text)
{
  selector_set ret;
  std::string css=strip_block_comments(text);

  for(auto it=std::sregex_iterator(css.begin(), css.end(), re_css_class); it!=std::sregex_iterator(); it++)
    ret.insert(selector(selector::css_class, (*it)[1].str()));
  for(auto it=std::sregex_iterator(css.begin(), css.end(), re_css_id); it!=std::sregex_iterator(); it++)
    ret.insert(selector(selector::css_id, (*it)[1].str()));

  return ret;
}

identifier_set extract_js_identifiers(std::string const& text)
{
  identifier_set ret;
  std::string js=strip_block_comments(strip_line_comments(text));

  // functions first: a name declared both ways keeps the function form
  for(auto it=std::sregex_iterator(js.begin(), js.end(), re_js_function); it!=std::sregex_iterator(); it++)
    ret.insert(identifier((*it)[1].str(), identifier::js_function));
  for(auto it=std::sregex_iterator(js.begin(), js.end(), re_js_var); it!=std::sregex_iterator(); it++)
    ret.insert(identifier((*it)[1].str(), identifier::js_variable));

  return ret;
}
