#pragma once

namespace pv_watch {

// Library version, kept in step with project() in CMakeLists.txt
constexpr const char* PV_WATCH_VERSION = "1.0.0";

} // namespace pv_watch
