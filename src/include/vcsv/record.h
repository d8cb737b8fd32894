#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vcsv {

// Calendar date without a time of day.
struct Date {
    int year = 1;
    int month = 1;
    int day = 1;

    // Parses YYYY-MM-DD, YYYY/MM/DD or M/D/YYYY, optionally followed by a
    // 'T' or ' ' and HH:MM[:SS[.fff]][Z]. The time part is checked and
    // discarded. Returns std::nullopt for anything else, including
    // out-of-range days such as 2023-02-29.
    static std::optional<Date> parse(const std::string& text);

    // ISO 8601 form, e.g. "2021-03-07".
    std::string toString() const;

    bool operator==(const Date& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const Date& o) const { return !(*this == o); }
};

struct Address {
    std::string street;
    std::string city;
    std::string state;
    std::string zipCode;

    bool operator==(const Address& o) const {
        return street == o.street && city == o.city && state == o.state && zipCode == o.zipCode;
    }
    bool operator!=(const Address& o) const { return !(*this == o); }
};

struct Project {
    std::string name;
    std::string role;
    Date startDate;
    std::optional<Date> endDate;

    bool operator==(const Project& o) const {
        return name == o.name && role == o.role && startDate == o.startDate && endDate == o.endDate;
    }
    bool operator!=(const Project& o) const { return !(*this == o); }
};

// One decoded person record.
struct Record {
    std::string name;
    int age = 0;
    std::string email;
    std::optional<std::string> phone;
    std::optional<std::string> department;
    std::optional<Date> startDate;

    std::vector<std::string> skills;
    std::vector<std::string> languages;
    std::optional<Address> address;
    std::vector<Project> projects;
    std::optional<std::string> notes;

    bool operator==(const Record& o) const;
    bool operator!=(const Record& o) const { return !(*this == o); }
};

// Render a record as JSON. With indent == 0 the output is a single line;
// otherwise objects are expanded with `indent` spaces per level. Absent
// optional fields are omitted.
std::string to_json(const Record& r, int indent = 0);

// Human readable multi-line summary, skipping empty fields and
// placeholder list entries.
std::string to_text(const Record& r);

}  // namespace vcsv
