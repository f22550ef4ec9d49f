#ifndef PROCESSING_HPP
#define PROCESSING_HPP

#include <regex>
#include <string>
#include <set>
#include <map>

#include "struc.hpp"
#include "scan.hpp"
#include "record.hpp"

// types
typedef std::map<std::string,std::string> strmap_t;

struct run_settings {
  bool process_css=true;
  bool process_js=true;
  bool write=true;
  bool quiet=false;
  bool has_css_exclude=false;
  bool has_js_exclude=false;
  std::regex css_exclude;
  std::regex js_exclude;
};

// state of one invocation, built from scratch every run
struct run_context {
  std::string root;
  project_files files;
  // html then js text, taken before any file is written
  std::string corpus;
  strmap_t js_contents;
  run_settings settings;
  change_recorder recorder;
};

/** util functions **/

// gen regexes
std::regex gen_regex_from_list(std::vector<std::string> const& in);
std::regex exclude_regex(std::string const& in);

void print_progress(run_context const& ctx, std::string const& message);

/** core **/

selector_set find_unused_selectors(std::string const& css, std::string const& corpus, run_settings const& settings);
identifier_set find_unused_identifiers(std::string const& js, std::string const& corpus, run_settings const& settings);

/** Processing **/

void build_corpus(run_context& ctx);

// return true if the file had removals
bool process_css_text(run_context& ctx, std::string const& path, std::string const& contents);
bool process_js_text(run_context& ctx, std::string const& path, std::string const& contents);
bool process_css_file(run_context& ctx, std::string const& path);
bool process_js_file(run_context& ctx, std::string const& path);

// css files then js files, the corpus must already be built
void process_files(run_context& ctx);

void list_unused(run_context& ctx);

#endif //PROCESSING_HPP
