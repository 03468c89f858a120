#pragma once

#include <string>

namespace pwrctrl {

// Resolution policy shared by device and plug searches.
//
// Case-insensitive substring match: "desk" matches "Desk Lamp" and
// "Standing desk". A full-string match is always accepted. An empty
// pattern only matches an empty candidate so that a blank argument never
// selects everything.
bool matches(const std::string &pattern, const std::string &candidate);

} // namespace pwrctrl
