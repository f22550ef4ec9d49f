#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <ztd/options.hpp>

#include "processing.hpp"

#define DEFAULT_LOG_FILE "unused_code_changes.txt"

extern ztd::option_set options;

extern bool g_log;
extern bool g_confirm;
extern std::string g_log_file;

// fill run settings from processed options
void get_opts(run_settings& settings);

void print_help(const char* arg0);

void oneshot_opt_process(const char* arg0);

// y/N prompt on stdin
bool confirm(std::string const& question);

#endif //OPTIONS_HPP
