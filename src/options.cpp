#include "options.hpp"

#include <iostream>

#include <stdlib.h>

#include "util.hpp"

#include "errcodes.h"
#include "version.h"

ztd::option_set options( {
  ztd::option("\r  [Help]"),
  ztd::option('h', "help",          false, "Display this help message"),
  ztd::option("version",            false, "Display version"),
  ztd::option("\r  [Output]"),
  ztd::option('o', "log",           true , "Write change log to file. Default: " DEFAULT_LOG_FILE, "file"),
  ztd::option("no-log",             false, "Don't write a change log"),
  ztd::option('y', "yes",           false, "Don't ask for confirmation before modifying files"),
  ztd::option('n', "dry-run",       false, "Log what would be removed without modifying files"),
  ztd::option('q', "quiet",         false, "Only print warnings and errors"),
  ztd::option("\r  [Processing]"),
  ztd::option("no-css",             false, "Don't process CSS files"),
  ztd::option("no-js",              false, "Don't process JavaScript files"),
  ztd::option("list-unused",        false, "List unused selectors and identifiers without modifying files"),
  ztd::option("exclude-css",        true,  "List of matching regex of CSS class/id names to never remove", "list"),
  ztd::option("exclude-js",         true,  "List of matching regex of JavaScript names to never remove", "list")
} );

bool g_log=true;
bool g_confirm=true;
std::string g_log_file=DEFAULT_LOG_FILE;

void get_opts(run_settings& settings)
{
  g_log=!options["no-log"].activated && !options["list-unused"].activated;
  g_confirm=!options['y'].activated && !options['n'].activated && !options["list-unused"].activated;
  if(options['o'])
    g_log_file=options['o'].argument;

  settings.process_css=!options["no-css"].activated;
  settings.process_js=!options["no-js"].activated;
  settings.write=!options['n'].activated;
  settings.quiet=options['q'].activated;
  if(options["exclude-css"])
  {
    settings.has_css_exclude=true;
    settings.css_exclude=exclude_regex(options["exclude-css"]);
  }
  if(options["exclude-js"])
  {
    settings.has_js_exclude=true;
    settings.js_exclude=exclude_regex(options["exclude-js"]);
  }
}

void print_help(const char* arg0)
{
  printf("%s [options] [directory]\n", arg0);
  printf("Unused CSS and JavaScript remover\n");
  printf("Find CSS selectors and JavaScript declarations never referenced in the project and delete them\n");
  printf("Directory defaults to the current directory\n");
  printf("\n");
  printf("Options:\n");
  options.print_help(4,25);
}

void oneshot_opt_process(const char* arg0)
{
  if(options['h'])
  {
    print_help(arg0);
    exit(ERR_HELP);
  }
  else if(options["version"])
  {
    printf("%s %s\n", arg0, VERSION_STRING);
    exit(0);
  }
}

bool confirm(std::string const& question)
{
  printf("%s (y/N): ", question.c_str());
  fflush(stdout);
  std::string response;
  if(!std::getline(std::cin, response))
    return false;
  response=trim(response);
  return response == "y" || response == "Y";
}
