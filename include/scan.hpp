#ifndef SCAN_HPP
#define SCAN_HPP

#include <string>
#include <vector>

struct project_files {
  std::vector<std::string> css;
  std::vector<std::string> js;
  std::vector<std::string> html;
  inline bool empty() const { return css.empty() && js.empty(); }
};

enum file_kind { kind_other, kind_css, kind_js, kind_html };

file_kind classify(std::string const& path);

// recursive, sorted. Throws if the root does not exist,
// a root that is not a directory is an empty project
project_files scan_files(std::string const& root);

// raw read, throws file_error
std::string import_file(std::string const& path);
// decoded read: empty string with a warning if unreadable
std::string read_file_safe(std::string const& path);
std::string decode_text(std::string const& raw);

// throws file_error
void export_file(std::string const& path, std::string const& contents);

#endif //SCAN_HPP
