#include "camkit/cli/router.hpp"

int main(int argc, char** argv) {
  return camkit::cli::Dispatch(argc, argv);
}
