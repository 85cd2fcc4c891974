#ifndef CUPKIT_TESTS_COMMON_CLI_DISPATCH_HPP_
#define CUPKIT_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "cupkit/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace cupkit::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return cupkit::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

struct CapturedRun {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
};

// Runs the router with stdout and stderr redirected into strings.
inline CapturedRun DispatchCaptured(const std::vector<std::string>& argv_storage) {
  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());

  CapturedRun run;
  run.exit_code = DispatchArgs(argv_storage);

  std::cout.rdbuf(original_out);
  std::cerr.rdbuf(original_err);
  run.stdout_text = captured_out.str();
  run.stderr_text = captured_err.str();
  return run;
}

} // namespace cupkit::tests::common

#endif // CUPKIT_TESTS_COMMON_CLI_DISPATCH_HPP_
