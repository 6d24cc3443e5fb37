#include <superbox/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace superbox {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool IsStdinTty() {
    return isatty(STDIN_FILENO) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

} // namespace superbox
