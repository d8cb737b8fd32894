#include <vcsv/layout.h>
#include <vcsv/decoder.h>
#include <vcsv/errors.h>
#include <vcsv/source.h>
#include <vcsv/tokenizer.h>

#include <fstream>
#include <vector>

namespace vcsv {

const char* layout_name(Layout layout) {
    return layout == Layout::Vertical ? "vertical" : "horizontal";
}

Layout guess_layout(std::istream& in) {
    StreamSource source(in);
    Tokenizer tokenizer(source);

    std::vector<std::vector<std::string>> lines;
    std::vector<std::string> line;
    while (lines.size() < 2 && tokenizer.nextLine(line)) {
        if (!line.empty()) lines.push_back(line);
    }
    if (lines.empty() || lines[0].size() < 2) {
        return Layout::Horizontal;
    }

    // Labels down the first column vote vertical, labels along the rest of
    // the first line vote horizontal.
    int vertical_score = 0;
    int horizontal_score = 0;
    for (auto const& l : lines) {
        if (is_known_label(l[0])) ++vertical_score;
    }
    for (size_t i = 1; i < lines[0].size(); ++i) {
        if (is_known_label(lines[0][i])) ++horizontal_score;
    }
    return vertical_score > horizontal_score ? Layout::Vertical : Layout::Horizontal;
}

Layout guess_layout_of_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw IoError("Failed to open file: " + path);
    return guess_layout(in);
}

}  // namespace vcsv
