#include "util.hpp"

#include <iostream>
#include <chrono>
#include <ctime>

#include <ztd/color.hpp>

std::string cut_last(std::string const& in, char c)
{
  size_t slr=in.rfind(c);
  if(slr != std::string::npos)
    return in.substr(slr+1);
  else
    return in;
}

std::string basename(std::string const& in)
{
  return cut_last(in, '/');
}

std::string extension(std::string const& in)
{
  std::string base=basename(in);
  size_t dot=base.rfind('.');
  // dotfiles have no extension
  if(dot == std::string::npos || dot == 0)
    return "";
  return to_lower(base.substr(dot));
}

std::vector<std::string> split(std::string const& in, const char* splitters)
{
  uint32_t i=0,j=0;
  std::vector<std::string> ret;
  // skip first splitters
  while(i<in.size() && is_in(in[i], splitters))
    i++;

  j=i;
  while(j<in.size())
  {
    while(i<in.size() && !is_in(in[i], splitters)) // count all non-splitters
      i++;
    ret.push_back(in.substr(j,i-j));
    i++;
    while(i<in.size() && is_in(in[i], splitters)) // skip splitters
      i++;
    j=i;
  }
  return ret;
}

std::vector<std::string> split_fields(std::string const& in, char c)
{
  std::vector<std::string> ret;
  size_t i=0,j=0;
  while((i=in.find(c, j)) != std::string::npos)
  {
    ret.push_back(in.substr(j,i-j));
    j=i+1;
  }
  ret.push_back(in.substr(j));
  return ret;
}

std::string join(std::vector<std::string> const& in, char c)
{
  std::string ret;
  for(uint32_t i=0; i<in.size(); i++)
  {
    if(i>0)
      ret += c;
    ret += in[i];
  }
  return ret;
}

std::string trim(std::string const& in)
{
  size_t i=0, j=in.size();
  while(i<j && is_space(in[i]))
    i++;
  while(j>i && is_space(in[j-1]))
    j--;
  return in.substr(i, j-i);
}

std::string to_lower(std::string in)
{
  for(auto& c: in)
  {
    if(c >= 'A' && c <= 'Z')
      c = c - 'A' + 'a';
  }
  return in;
}

uint32_t count_char(std::string const& in, char c)
{
  uint32_t n=0;
  for(auto it: in)
  {
    if(it == c)
      n++;
  }
  return n;
}

std::string regex_escape(std::string const& in)
{
  std::string ret;
  for(auto it: in)
  {
    if(is_in(it, "\\^$.|?*+()[]{}/"))
      ret += '\\';
    ret += it;
  }
  return ret;
}

std::string repeatString(std::string const& str, uint32_t n)
{
  std::string ret;
  for(uint32_t i=0; i<n; i++)
  ret += str;
  return ret;
}

/** ENCODING **/

bool is_utf8(std::string const& in)
{
  const unsigned char* s = (const unsigned char*) in.data();
  size_t n=in.size();
  size_t i=0;
  while(i<n)
  {
    unsigned char c=s[i];
    uint32_t len;
    uint32_t cp;
    if(c < 0x80)
    {
      i++;
      continue;
    }
    else if(c >= 0xC2 && c <= 0xDF) {
      len=1; cp=c & 0x1F;
    }
    else if(c >= 0xE0 && c <= 0xEF) {
      len=2; cp=c & 0x0F;
    }
    else if(c >= 0xF0 && c <= 0xF4) {
      len=3; cp=c & 0x07;
    }
    else
      return false;
    // truncated sequence
    if(i+len >= n)
      return false;
    for(uint32_t k=1; k<=len; k++)
    {
      if((s[i+k] & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (s[i+k] & 0x3F);
    }
    // overlong, surrogates, out of range
    if( (len==2 && cp < 0x800) || (len==3 && cp < 0x10000) || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF )
      return false;
    i += len+1;
  }
  return true;
}

std::string latin1_to_utf8(std::string const& in)
{
  std::string ret;
  ret.reserve(in.size());
  for(auto it: in)
  {
    unsigned char c = (unsigned char) it;
    if(c < 0x80)
      ret += (char) c;
    else
    {
      ret += (char) (0xC0 | (c >> 6));
      ret += (char) (0x80 | (c & 0x3F));
    }
  }
  return ret;
}

std::string normalize_newlines(std::string const& in)
{
  std::string ret;
  ret.reserve(in.size());
  for(size_t i=0; i<in.size(); i++)
  {
    if(in[i] == '\r')
    {
      ret += '\n';
      if(i+1<in.size() && in[i+1] == '\n')
        i++;
    }
    else
      ret += in[i];
  }
  return ret;
}

/** TIME **/

std::string iso_timestamp()
{
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  long micro = (long) (std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000);
  std::tm tm;
  localtime_r(&t, &tm);
  char buf[64];
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return strf("%s.%06ld", buf, micro);
}

std::string date_string()
{
  std::time_t t = std::time(nullptr);
  std::tm tm;
  localtime_r(&t, &tm);
  char buf[64];
  strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf);
}

void print_file_error(file_error const& e)
{
  std::cerr << ztd::color::b_white;
  fprintf(stderr, "%s: ", e.origin());

  ztd::color level_color;
  const std::string& level = e.level();
  if(level == "error")
    level_color = ztd::color::b_red;
  else if(level == "warning")
    level_color = ztd::color::b_magenta;
  else if(level == "info")
    level_color = ztd::color::b_cyan;

  std::cerr << level_color << e.level() << ztd::color::none;
  fprintf(stderr, ": %s\n", e.what());
}
