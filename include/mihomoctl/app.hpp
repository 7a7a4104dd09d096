#pragma once
#include "error.hpp"

namespace mihomoctl {

// 2 usage, 10 network, 11 not-found, 12 conflict, 13 validation, 14 auth,
// 15 process, 16 io.
int exit_code(ErrorKind k);

class App {
public:
  int run(int argc, char **argv);
};

} // namespace mihomoctl
