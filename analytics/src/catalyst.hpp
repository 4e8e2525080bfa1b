#pragma once

#include <string>
#include <vector>

// Maps a free-text catalyst description to a category id such as
// "earnings" or "fda_approval". Rows already carrying a category id keep it.
std::string categorize_catalyst(const std::string& catalyst_text);

// Every category id, in matching order, ending with "other"
const std::vector<std::string>& catalyst_categories();
