#pragma once

#include <string>
#include <vector>

namespace feedbacker {

// Tab-separated list encoding used for list-valued columns in the store.
std::string Escape(const std::string &value);
std::string Unescape(const std::string &value);
std::string JoinEscaped(const std::vector<std::string> &values);
std::vector<std::string> SplitEscaped(const std::string &line);

std::string EscapeJson(const std::string &value);

} // namespace feedbacker
