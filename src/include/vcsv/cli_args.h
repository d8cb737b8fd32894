#pragma once

#include <vcsv/layout.h>
#include <vcsv/source.h>

#include <cstdint>
#include <optional>
#include <string>

namespace vcsv {

// Command-line arguments of the vcsv tool:
//   vcsv <file> [--horizontal|--vertical|--auto] [--schema <1-4>]
//        [--mmap-threshold <bytes>] [--count|--fields|--undeclared]
//        [--as-json] [--verbose]
// Throws std::invalid_argument for unknown flags or bad values.
class CliArgs {
public:
    enum class Action {
        HELP,        // Show help message
        PRINT,       // Print accepted records (default)
        COUNT,       // Print the number of accepted records
        FIELDS,      // List the raw labels found in the file
        UNDECLARED   // List labels the schema does not declare
    };

    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::string& getFilePath() const { return filePath_; }
    // std::nullopt means "guess from the file".
    std::optional<Layout> getLayout() const { return layout_; }
    int getSchemaVersion() const { return schemaVersion_; }
    std::uint64_t getMmapThreshold() const { return mmapThreshold_; }
    bool outputAsJson() const { return asJson_; }
    bool verbose() const { return verbose_; }

private:
    Action action_ = Action::HELP;
    std::string filePath_;
    std::optional<Layout> layout_;
    int schemaVersion_ = 4;
    std::uint64_t mmapThreshold_ = kMappedFileThreshold;
    bool asJson_ = false;
    bool verbose_ = false;
};

}  // namespace vcsv
