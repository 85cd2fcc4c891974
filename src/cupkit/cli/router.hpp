#pragma once

namespace cupkit::cli {

// Routes `cupkit` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation (I/O)
//   2  => usage error (unknown command / invalid args / invalid codename)
//   10 => not found, 11 => already exists, 12 => missing field,
//   13 => parse error, 20 => partial failure, 30 => verify found errors
//
// Command output goes to stdout; logs and `error: <CODE>: <message>` lines go
// to stderr.
int Dispatch(int argc, char** argv);

} // namespace cupkit::cli
