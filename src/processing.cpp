#include "processing.hpp"

#include "extract.hpp"
#include "reference.hpp"
#include "prune.hpp"
#include "util.hpp"

/** TOOLS **/

inline std::vector<std::string> get_list(std::string const& in)
{
  return split(in, ", \t\n");
}

std::regex gen_regex_from_list(std::vector<std::string> const& in)
{
  std::string re;
  for(auto it: in)
    re += '('+it+")|";
  if(re.size()>0)
    re.pop_back();
  return std::regex(re);
}

std::regex exclude_regex(std::string const& in)
{
  return gen_regex_from_list(get_list(in));
}

void print_progress(run_context const& ctx, std::string const& message)
{
  if(!ctx.settings.quiet)
    printf("%s\n", message.c_str());
}

/** CORE **/

selector_set find_unused_selectors(std::string const& css, std::string const& corpus, run_settings const& settings)
{
  selector_set selectors = extract_css_selectors(css);
  if(settings.has_css_exclude)
    prune_matching(selectors, settings.css_exclude);
  return set_minus(selectors, find_css_references(corpus, selectors));
}

identifier_set find_unused_identifiers(std::string const& js, std::string const& corpus, run_settings const& settings)
{
  identifier_set identifiers = extract_js_identifiers(js);
  if(settings.has_js_exclude)
    prune_matching(identifiers, settings.js_exclude);
  return set_minus(identifiers, find_js_references(corpus, identifiers));
}

/** PROCESSING **/

void build_corpus(run_context& ctx)
{
  ctx.corpus.clear();
  ctx.js_contents.clear();
  for(auto it: ctx.files.html)
    ctx.corpus += '\n' + read_file_safe(it);
  for(auto it: ctx.files.js)
  {
    std::string contents=read_file_safe(it);
    ctx.corpus += '\n' + contents;
    ctx.js_contents[it] = contents;
  }
}

// record and write back
static void commit(run_context& ctx, std::string const& path, std::string const& type, std::set<std::string> const& items, std::string const& contents, std::string const& new_contents)
{
  ctx.recorder.add(path, type, items, contents.size(), new_contents.size());
  if(!ctx.settings.write)
    return;
  try
  {
    export_file(path, new_contents);
  }
  catch(file_error& e)
  {
    print_file_error(file_error("Error writing file: "+std::string(e.what()), path));
  }
}

bool process_css_text(run_context& ctx, std::string const& path, std::string const& contents)
{
  if(contents.empty())
    return false;

  selector_set unused = find_unused_selectors(contents, ctx.corpus, ctx.settings);
  if(unused.empty())
    return false;

  print_progress(ctx, strf("  Found %lu unused CSS selectors", unused.size()));
  std::string new_contents = remove_unused_css_rules(contents, unused);
  commit(ctx, path, FILETYPE_CSS, to_strings(unused), contents, new_contents);
  return true;
}

bool process_js_text(run_context& ctx, std::string const& path, std::string const& contents)
{
  if(contents.empty())
    return false;

  identifier_set unused = find_unused_identifiers(contents, ctx.corpus, ctx.settings);
  if(unused.empty())
    return false;

  print_progress(ctx, strf("  Found %lu unused JS identifiers", unused.size()));
  std::string new_contents = remove_unused_js_code(contents, unused);
  commit(ctx, path, FILETYPE_JS, to_strings(unused), contents, new_contents);
  return true;
}

bool process_css_file(run_context& ctx, std::string const& path)
{
  print_progress(ctx, "Processing CSS: "+path);
  return process_css_text(ctx, path, read_file_safe(path));
}

bool process_js_file(run_context& ctx, std::string const& path)
{
  print_progress(ctx, "Processing JS: "+path);
  // read once with the corpus
  auto el=ctx.js_contents.find(path);
  if(el == ctx.js_contents.end())
    return process_js_text(ctx, path, read_file_safe(path));
  return process_js_text(ctx, path, el->second);
}

void process_files(run_context& ctx)
{
  print_progress(ctx, "Processing files...");
  if(ctx.settings.process_css)
  {
    for(auto it: ctx.files.css)
      process_css_file(ctx, it);
  }
  if(ctx.settings.process_js)
  {
    for(auto it: ctx.files.js)
      process_js_file(ctx, it);
  }
}

void list_unused(run_context& ctx)
{
  if(ctx.settings.process_css)
  {
    for(auto it: ctx.files.css)
    {
      for(auto sel: find_unused_selectors(read_file_safe(it), ctx.corpus, ctx.settings))
        printf("%s: %s\n", it.c_str(), sel.str().c_str());
    }
  }
  if(ctx.settings.process_js)
  {
    for(auto it: ctx.files.js)
    {
      for(auto id: find_unused_identifiers(ctx.js_contents[it], ctx.corpus, ctx.settings))
        printf("%s: %s\n", it.c_str(), id.str().c_str());
    }
  }
}
