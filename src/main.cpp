#include <iostream>

#include <ztd/options.hpp>

#include "util.hpp"
#include "options.hpp"
#include "processing.hpp"
#include "record.hpp"
#include "scan.hpp"

#include "errcodes.h"

int main(int argc, char* argv[])
{
  std::vector<std::string> args;

  run_context ctx;
  try
  {
    args=options.process(argc, argv, {.output_doubledash=false} );

    oneshot_opt_process(argv[0]);
    get_opts(ctx.settings);

    if(args.size() > 1)
      throw std::runtime_error("Unexpected argument: '"+args[1]+"'");
    ctx.root = args.size() > 0 ? args[0] : ".";

    print_progress(ctx, "Scanning directory: "+ctx.root);
    ctx.files = scan_files(ctx.root);
    print_progress(ctx, strf("Found %lu JS files, %lu CSS files, %lu HTML files",
      ctx.files.js.size(), ctx.files.css.size(), ctx.files.html.size()) );

    if(ctx.files.empty())
    {
      std::cerr << "No JavaScript or CSS files found" << std::endl;
      return ERR_NOFILES;
    }

    // snapshot before any write
    build_corpus(ctx);

    if(options["list-unused"])
    {
      list_unused(ctx);
      return 0;
    }

    if(g_confirm)
    {
      printf("\nWARNING: This will modify your files.\n");
      printf("Make sure you have backups before proceeding!\n");
      if(!confirm("Continue?"))
      {
        printf("Operation cancelled\n");
        return ERR_CANCEL;
      }
    }

    process_files(ctx);

    if(g_log)
    {
      try
      {
        export_file(g_log_file, gen_report(ctx.recorder, date_string()));
        print_progress(ctx, "Changes log saved to: "+g_log_file);
      }
      catch(file_error& e)
      {
        print_file_error(e);
        return ERR_RUNTIME;
      }
    }

    print_progress(ctx, strf("\nProcess completed! %lu files changed, %ld bytes saved.",
      ctx.recorder.size(), ctx.recorder.total_bytes_saved()) );
  }
  catch(ztd::option_error& e)
  {
    std::cerr << e.what() << std::endl;
    return ERR_OPT;
  }
  catch(std::runtime_error& e)
  {
    std::cerr << e.what() << std::endl;
    return ERR_RUNTIME;
  }

  return 0;
}
