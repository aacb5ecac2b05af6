#pragma once

namespace pem {

/// Installs the console sink (once) and sets the Boost.Log severity filter:
/// debug and up when verbose, info and up otherwise.
void initLogging(bool verbose);

} // namespace pem
