#pragma once

#include <string>
#include "types.hpp"

// Project name validation. Pure and cheap enough to run on every keystroke.
//
// Rules, first failure wins:
//   1. not empty / whitespace-only
//   2. [A-Za-z0-9][A-Za-z0-9._-]{0,63}
//   3. no trailing '.' or ' '
//   4. not a reserved device name (CON, PRN, AUX, NUL, COM1-9, LPT1-9),
//      compared case-insensitively
ValidationResult validate_project_name(const std::string& name);

// True if `name` equals a reserved device name, ignoring case.
bool is_reserved_device_name(const std::string& name);
