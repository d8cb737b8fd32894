#include <vcsv/schema.h>
#include <vcsv/field_path.h>
#include <vcsv/tokenizer.h>

#include <stdexcept>
#include <unordered_map>

namespace vcsv {

namespace {
    using Check = bool (*)(const Record&);

    bool present(const std::optional<std::string>& s) { return s && !is_blank(*s); }

    // Lower-cased required name -> "has a non-default value" test.
    const std::unordered_map<std::string, Check>& required_checks() {
        static const std::unordered_map<std::string, Check> table = {
            {"name", [](const Record& r) { return !is_blank(r.name); }},
            {"email", [](const Record& r) { return !is_blank(r.email); }},
            {"age", [](const Record& r) { return r.age > 0; }},
            {"phone", [](const Record& r) { return present(r.phone); }},
            {"department", [](const Record& r) { return present(r.department); }},
            {"notes", [](const Record& r) { return present(r.notes); }},
            {"startdate", [](const Record& r) { return r.startDate.has_value(); }},
            {"address", [](const Record& r) { return r.address.has_value(); }},
            {"skills", [](const Record& r) { return !r.skills.empty(); }},
            {"languages", [](const Record& r) { return !r.languages.empty(); }},
            {"projects", [](const Record& r) { return !r.projects.empty(); }},
        };
        return table;
    }

    const std::vector<std::string> kBaseRequired = {"Name", "Age", "Email"};
}  // anonymous namespace

Schema::Schema(int version,
               std::vector<std::string> required_fields,
               std::vector<std::string> optional_fields,
               std::vector<std::string> optional_field_patterns)
    : version_(version),
      required_(std::move(required_fields)),
      optional_(std::move(optional_fields)),
      patterns_(std::move(optional_field_patterns)) {
    for (auto const& f : required_) {
        required_lower_.push_back(to_lower(f));
        declared_lower_.insert(to_lower(f));
    }
    for (auto const& f : optional_) declared_lower_.insert(to_lower(f));
    compiled_.reserve(patterns_.size());
    for (auto const& p : patterns_) {
        compiled_.emplace_back(p, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    }
}

Schema Schema::v1() { return Schema(1, kBaseRequired); }

Schema Schema::v2() { return Schema(2, kBaseRequired, {"Phone"}); }

Schema Schema::v3() { return Schema(3, kBaseRequired, {"Phone", "Department", "StartDate"}); }

Schema Schema::v4() {
    return Schema(4, kBaseRequired,
                  {"Phone", "Department", "StartDate", "Notes", "Address.Street", "Address.City",
                   "Address.State", "Address.ZipCode"},
                  {R"(^Skills\[\d+\]$)", R"(^Languages\[\d+\]$)", R"(^Projects\[\d+\]\.Name$)",
                   R"(^Projects\[\d+\]\.Role$)", R"(^Projects\[\d+\]\.StartDate$)",
                   R"(^Projects\[\d+\]\.EndDate$)"});
}

Schema Schema::fromVersion(int version) {
    switch (version) {
        case 1:
            return v1();
        case 2:
            return v2();
        case 3:
            return v3();
        case 4:
            return v4();
        default:
            throw std::invalid_argument("unknown schema version " + std::to_string(version) +
                                        " (expected 1-4)");
    }
}

bool Schema::accepts(const Record& record) const {
    auto const& checks = required_checks();
    for (auto const& name : required_lower_) {
        auto it = checks.find(name);
        if (it != checks.end() && !it->second(record)) return false;
    }
    return true;
}

bool Schema::declares(const std::string& label) const {
    if (declared_lower_.count(to_lower(label))) return true;
    for (auto const& re : compiled_) {
        if (std::regex_search(label, re)) return true;
    }
    return false;
}

}  // namespace vcsv
