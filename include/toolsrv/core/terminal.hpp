#pragma once

namespace toolsrv {

/// Returns true if stderr is a terminal (log output goes there).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Colored logs only when stderr is a terminal and NO_COLOR is unset,
/// unless forced either way.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace toolsrv
