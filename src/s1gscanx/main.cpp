#include "commands/regions.hpp"
#include "commands/scan.hpp"
#include <args.hxx>
#include <redlog.hpp>
#include <algorithm>
#include <iostream>
#include <string>

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

// -v verbose, -vv trace, -vvv debug, -vvvv and up pedantic
void apply_verbosity() {
  static constexpr redlog::level levels[] = {
      redlog::level::info, redlog::level::verbose, redlog::level::trace, redlog::level::debug,
      redlog::level::pedantic
  };
  int count = std::clamp(args::get(verbosity_flag), 0, 4);
  redlog::set_level(levels[count]);
}
} // namespace cli

int cmd_scan(
    args::ValueFlag<int>& pid_flag, args::ValueFlag<std::string>& file_flag, args::ValueFlag<std::string>& base_flag,
    args::ValueFlag<std::string>& signature_flag, args::ValueFlagList<std::string>& region_flag, args::Flag& all_flag,
    args::ValueFlag<size_t>& max_flag
) {
  cli::apply_verbosity();

  s1gscanx::commands::scan_request request;
  if (signature_flag) {
    request.signature = args::get(signature_flag);
  }
  if (pid_flag) {
    request.pid = args::get(pid_flag);
  }
  if (file_flag) {
    request.input_file = args::get(file_flag);
  }
  if (base_flag) {
    request.base_address = args::get(base_flag);
  }
  if (region_flag) {
    request.extra_regions = args::get(region_flag);
  }
  request.all = args::get(all_flag);
  if (max_flag) {
    request.max_matches = args::get(max_flag);
  }

  return s1gscanx::commands::scan_command(request);
}

int cmd_regions(args::ValueFlag<int>& pid_flag) {
  cli::apply_verbosity();

  s1gscanx::commands::regions_request request;
  if (pid_flag) {
    request.pid = args::get(pid_flag);
  }

  return s1gscanx::commands::regions_command(request);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("s1gscanx - array-of-bytes signature scanner");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  // global flags
  parser.Add(cli::arguments);

  // scan command
  args::Command scan_cmd(parser, "scan", "find a signature in a process or raw dump");
  args::ValueFlag<int> scan_pid_flag(scan_cmd, "pid", "target process id", {'p', "pid"});
  args::ValueFlag<std::string> scan_file_flag(scan_cmd, "file", "raw dump to scan instead of a process", {'f', "file"});
  args::ValueFlag<std::string> scan_base_flag(scan_cmd, "base", "load address of the dump (hex)", {"base"});
  args::ValueFlag<std::string> scan_signature_flag(
      scan_cmd, "signature", "signature, e.g. \"8B 3F 93 ?\"", {'s', "signature"}
  );
  args::ValueFlagList<std::string> scan_region_flag(
      scan_cmd, "region", "extra <base>:<size> range to capture (hex)", {'r', "region"}
  );
  args::Flag scan_all_flag(scan_cmd, "all", "report every non-overlapping match", {'a', "all"});
  args::ValueFlag<size_t> scan_max_flag(scan_cmd, "max", "stop after this many matches (with --all)", {"max"});

  // regions command
  args::Command regions_cmd(parser, "regions", "list the executable regions captured from a process");
  args::ValueFlag<int> regions_pid_flag(regions_cmd, "pid", "target process id", {'p', "pid"});

  try {
    parser.ParseCLI(argc, argv);

    if (scan_cmd) {
      return cmd_scan(
          scan_pid_flag, scan_file_flag, scan_base_flag, scan_signature_flag, scan_region_flag, scan_all_flag,
          scan_max_flag
      );
    } else if (regions_cmd) {
      return cmd_regions(regions_pid_flag);
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 1;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  return 0;
}
