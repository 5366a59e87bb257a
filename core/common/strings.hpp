#pragma once

#include <string>

namespace arena {

/// Strip leading and trailing whitespace.
std::string trim(const std::string& s);

/// Replace every occurrence of `from` in `text` with `to`.
std::string replaceAll(std::string text, const std::string& from, const std::string& to);

} // namespace arena
