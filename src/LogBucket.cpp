// logbucket command-line driver; see Tools.h.

#include <iostream>

#include "Tools.h"

int main(int argc, char *argv[]) {
  return runLogBucket(argc, argv, std::cout, std::cerr);
}
