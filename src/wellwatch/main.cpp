#include "wellwatch/cli/router.hpp"

int main(int argc, char** argv) {
  return wellwatch::cli::Dispatch(argc, argv);
}
