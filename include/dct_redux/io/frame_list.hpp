#pragma once

#include "dct_redux/core/types.hpp"
#include <string>
#include <vector>

namespace dct_redux::io {

// Expand a frame-list pattern relative to `directory`. Accepted forms (not mixed):
//   bias_01                   single name
//   bias_01, bias_02          comma-separated names
//   bias_0[1,2,3]             common prefix with bracketed alternatives
//   bias_*                    wildcard, matched against the directory listing
// A missing ".fits" extension is appended. Directory parts inside the pattern
// are honoured. An empty pattern yields an empty list.
std::vector<fs::path> expand_frame_list(const fs::path& directory, const std::string& pattern);

} // namespace dct_redux::io
