#pragma once

namespace weft::driver {

// Install the stderr logger used by the whole tool. Verbosity 0 logs
// warnings only, 1 enables debug, 2 and above trace.
void SetupLogging(int verbosity);

}  // namespace weft::driver
