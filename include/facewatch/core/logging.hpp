#pragma once
#include <string>

namespace facewatch {

// Installs the default spdlog logger: colored console, plus a rotating
// file (5 MB x 3) when `file` is not empty. Unknown levels fall back to info.
void init_logging(const std::string& level = "info", const std::string& file = "");

} // namespace facewatch
