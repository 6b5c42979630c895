#pragma once
// Purpose: dlid-decode command-line application.

#include <string>

namespace app {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_PARSE_FAILED = 1,
    EXIT_INCOMPLETE = 2,
    EXIT_IO_ERROR = 3,
    EXIT_USAGE = 64
};

class App {
public:
    int run(int argc, char** argv);
};

std::string usage();

} // namespace app
