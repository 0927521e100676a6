#pragma once
#include <string>

namespace fixity {

// Reads a password from the controlling terminal with echo turned off.
// Falls back to a plain line from stdin when there is no terminal.
std::string prompt_password(const std::string& prompt);

}
