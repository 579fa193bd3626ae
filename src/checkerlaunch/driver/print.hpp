#pragma once

#include <string>

#include "checkerlaunch/common/diagnostic.hpp"

namespace checkerlaunch::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace checkerlaunch::driver
