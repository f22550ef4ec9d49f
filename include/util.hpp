#ifndef UTIL_HPP
#define UTIL_HPP

#include <string>
#include <vector>
#include <memory>
#include <exception>
#include <stdexcept>
#include <set>
#include <algorithm>
#include <regex>

#include <stdio.h>
#include <string.h>

#include "struc.hpp"

std::string cut_last(std::string const& in, char c);
std::string basename(std::string const& in);
std::string extension(std::string const& in);

std::vector<std::string> split(std::string const& in, const char* splitters);
// keeps empty fields: "a," gives { "a", "" }
std::vector<std::string> split_fields(std::string const& in, char c);
inline std::vector<std::string> split_lines(std::string const& in) { return split_fields(in, '\n'); }
std::string join(std::vector<std::string> const& in, char c);

std::string trim(std::string const& in);
std::string to_lower(std::string in);
uint32_t count_char(std::string const& in, char c);

std::string regex_escape(std::string const& in);

inline bool is_num(char c) { return (c >= '0' && c <= '9'); }
inline bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
inline bool is_alphanum(char c) { return is_alpha(c) || is_num(c); }
inline bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

template<typename ... Args>
std::string strf( const std::string& format, Args ... args )
{
    size_t size = snprintf( nullptr, 0, format.c_str(), args ... ) + 1; // Extra space for '\0'
    if( size <= 0 )
      throw std::runtime_error( "Error during formatting." );
    std::unique_ptr<char[]> buf( new char[ size ] );
    snprintf( buf.get(), size, format.c_str(), args ... );
    return std::string( buf.get(), buf.get() + size - 1 ); // We don't want the '\0' inside
}

inline bool is_in(char c, const char* set) {
  return strchr(set, c) != NULL;
}

// elements of a not in b
template <class T>
std::set<T> set_minus(std::set<T> const& a, std::set<T> const& b)
{
  std::set<T> ret;
  for(auto it: a)
  {
    if(b.find(it) == b.end())
      ret.insert(it);
  }
  return ret;
}

// remove elements whose name matches, return removed elements
template <class T>
std::set<T> prune_matching(std::set<T>& in, std::regex const& re)
{
  std::set<T> ret;
  auto it=in.begin();
  while(it!=in.end())
  {
    if( std::regex_match(it->name, re) )
    {
      ret.insert(*it);
      it = in.erase(it);
    }
    else
      it++;
  }
  return ret;
}

template <class T>
std::set<std::string> to_strings(std::set<T> const& in)
{
  std::set<std::string> ret;
  for(auto it: in)
    ret.insert(it.str());
  return ret;
}

std::string repeatString(std::string const& str, uint32_t n);

// text encoding
bool is_utf8(std::string const& in);
std::string latin1_to_utf8(std::string const& in);
std::string normalize_newlines(std::string const& in);

// time
std::string iso_timestamp();
std::string date_string();

void print_file_error(file_error const& e);

#endif //UTIL_HPP
