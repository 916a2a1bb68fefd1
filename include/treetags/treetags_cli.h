#pragma once

#include <string>
#include <vector>

namespace treetags {

int RunTreetags(const std::vector<std::string> &arguments);

} // namespace treetags
