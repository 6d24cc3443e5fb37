#pragma once

namespace superbox {

/// True if stderr is a terminal (coloured log output).
bool IsStderrTty();

/// True if stdin is a terminal; `call` then refuses to wait for a piped body.
bool IsStdinTty();

/// True if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

} // namespace superbox
