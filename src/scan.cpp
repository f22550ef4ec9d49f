#include "scan.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>

#include "struc.hpp"
#include "util.hpp"

namespace fs = std::filesystem;

file_kind classify(std::string const& path)
{
  std::string ext=extension(path);
  if(ext == ".js")
    return kind_js;
  else if(ext == ".css")
    return kind_css;
  else if(ext == ".html" || ext == ".htm")
    return kind_html;
  return kind_other;
}

project_files scan_files(std::string const& root)
{
  std::error_code ec;
  if(!fs::exists(root, ec))
    throw std::runtime_error("Directory "+root+" does not exist");

  project_files ret;
  if(!fs::is_directory(root, ec))
  {
    print_file_error(file_error("Not a directory, nothing to scan", root, "warning"));
    return ret;
  }
  auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
  if(ec)
  {
    print_file_error(file_error("Cannot read directory: "+ec.message(), root, "warning"));
    return ret;
  }
  while(it != fs::recursive_directory_iterator())
  {
    if(it->is_regular_file(ec))
    {
      std::string path=it->path().string();
      switch(classify(path))
      {
        case kind_css: ret.css.push_back(path); break;
        case kind_js: ret.js.push_back(path); break;
        case kind_html: ret.html.push_back(path); break;
        default: break;
      }
    }
    it.increment(ec);
    if(ec)
    {
      // unreadable entry, the walk goes on with what is left
      print_file_error(file_error("Error while scanning: "+ec.message(), root, "warning"));
      ec.clear();
    }
  }
  std::sort(ret.css.begin(), ret.css.end());
  std::sort(ret.js.begin(), ret.js.end());
  std::sort(ret.html.begin(), ret.html.end());
  return ret;
}

std::string import_file(std::string const& path)
{
  std::ifstream st(path, std::ios::in | std::ios::binary);
  if(!st)
    throw file_error("Cannot open stream to '"+path+'\'', path);

  std::stringstream ss;
  ss << st.rdbuf();
  if(st.bad())
    throw file_error("Read error on '"+path+'\'', path);
  st.close();
  return ss.str();
}

std::string decode_text(std::string const& raw)
{
  // utf-8 first, latin-1 accepts any byte
  if(is_utf8(raw))
    return normalize_newlines(raw);
  return normalize_newlines(latin1_to_utf8(raw));
}

std::string read_file_safe(std::string const& path)
{
  try
  {
    return decode_text(import_file(path));
  }
  catch(file_error& e)
  {
    print_file_error(file_error("Could not read file: "+std::string(e.what()), path, "warning"));
  }
  return "";
}

void export_file(std::string const& path, std::string const& contents)
{
  std::ofstream st(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if(!st)
    throw file_error("Cannot open '"+path+"' for writing", path);
  st << contents;
  st.close();
  if(st.fail())
    throw file_error("Write error on '"+path+'\'', path);
}
