#pragma once

#include <istream>
#include <string>

namespace vcsv {

enum class Layout {
    Horizontal,  // header line, then one line per record
    Vertical     // one line per field, one column per record
};

const char* layout_name(Layout layout);

// Heuristic used when the caller does not say which layout a file uses.
// Looks at the first two non-empty lines: in a vertical file the first
// field of each line is a known label and the rest of the first line is
// data; in a horizontal file the whole first line is labels. Falls back to
// Horizontal.
Layout guess_layout(std::istream& in);
Layout guess_layout_of_file(const std::string& path);

}  // namespace vcsv
