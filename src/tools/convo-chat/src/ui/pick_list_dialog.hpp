#pragma once

#include "../tvision_include.hpp"

#include <optional>
#include <string>
#include <vector>

// Modal list of labels. Returns the chosen index, or nothing when cancelled.
std::optional<std::size_t> pickFromList(const std::string &title, const std::string &prompt,
                                        const std::vector<std::string> &labels,
                                        std::size_t initial = 0);
