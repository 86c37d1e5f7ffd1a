// logavg command-line driver; see Tools.h.

#include <iostream>

#include "Tools.h"

int main(int argc, char *argv[]) {
  return runLogAverage(argc, argv, std::cout, std::cerr);
}
