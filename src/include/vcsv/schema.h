#pragma once

#include <vcsv/record.h>

#include <regex>
#include <set>
#include <string>
#include <vector>

namespace vcsv {

// Describes one revision of the record layout. Immutable once built;
// optional-field patterns are compiled in the constructor and matched
// case-insensitively.
class Schema {
public:
    Schema(int version,
           std::vector<std::string> required_fields,
           std::vector<std::string> optional_fields = {},
           std::vector<std::string> optional_field_patterns = {});

    static Schema v1();
    static Schema v2();
    static Schema v3();
    static Schema v4();
    // Preset for versions 1 to 4; throws std::invalid_argument otherwise.
    static Schema fromVersion(int version);

    int version() const { return version_; }
    const std::vector<std::string>& requiredFields() const { return required_; }
    const std::vector<std::string>& optionalFields() const { return optional_; }
    const std::vector<std::string>& optionalFieldPatterns() const { return patterns_; }

    // Acceptance rule applied to every decoded record: each required name
    // must resolve to a non-default value. Required names without a known
    // check are satisfied.
    bool accepts(const Record& record) const;

    // True if a raw label is required, optional, or matches one of the
    // optional patterns. Informational only; decoding ignores it.
    bool declares(const std::string& label) const;

private:
    int version_;
    std::vector<std::string> required_;
    std::vector<std::string> optional_;
    std::vector<std::string> patterns_;

    std::vector<std::string> required_lower_;
    std::set<std::string> declared_lower_;
    std::vector<std::regex> compiled_;
};

}  // namespace vcsv
