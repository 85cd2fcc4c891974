#include "cupkit/cli/router.hpp"

int main(int argc, char** argv) {
  // All parsing and exit-code contracts live in the CLI router.
  return cupkit::cli::Dispatch(argc, argv);
}
