#include <vcsv/record.h>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace vcsv {

namespace {
    bool all_digits(const std::string& s) {
        if (s.empty()) return false;
        for (char c : s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }

    // Parses a run of 1..max_len digits into `out`.
    bool parse_number(const std::string& s, size_t min_len, size_t max_len, int& out) {
        if (s.size() < min_len || s.size() > max_len || !all_digits(s)) return false;
        out = std::stoi(s);
        return true;
    }

    std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> parts;
        std::string part;
        for (char c : s) {
            if (c == sep) {
                parts.push_back(part);
                part.clear();
            } else {
                part += c;
            }
        }
        parts.push_back(part);
        return parts;
    }

    bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

    int days_in_month(int y, int m) {
        static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && is_leap_year(y)) return 29;
        return kDays[m - 1];
    }

    // HH:MM[:SS[.fff]][Z]
    bool valid_time(std::string t) {
        if (!t.empty() && (t.back() == 'Z' || t.back() == 'z')) t.pop_back();
        auto fields = split(t, ':');
        if (fields.size() < 2 || fields.size() > 3) return false;
        int h = 0, m = 0, s = 0;
        if (!parse_number(fields[0], 1, 2, h) || h > 23) return false;
        if (!parse_number(fields[1], 2, 2, m) || m > 59) return false;
        if (fields.size() == 3) {
            std::string sec = fields[2];
            size_t dot = sec.find('.');
            if (dot != std::string::npos) {
                if (!all_digits(sec.substr(dot + 1))) return false;
                sec = sec.substr(0, dot);
            }
            if (!parse_number(sec, 2, 2, s) || s > 59) return false;
        }
        return true;
    }

    std::string escape_json_string(const std::string& s) {
        std::string result;
        result.reserve(s.size() + 2);
        result.push_back('"');
        for (char c : s) {
            switch (c) {
                case '"':
                    result += "\\\"";
                    break;
                case '\\':
                    result += "\\\\";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        result += buf;
                    } else {
                        result.push_back(c);
                    }
                    break;
            }
        }
        result.push_back('"');
        return result;
    }

    // Streams JSON objects; nested objects are expanded when indent > 0 while
    // string arrays always stay on one line.
    struct JsonWriter {
        std::ostringstream out;
        int indent;
        int level = 0;
        bool first = true;

        explicit JsonWriter(int ind) : indent(ind) {}

        void newline() {
            if (indent > 0) out << '\n' << std::string(static_cast<size_t>(level * indent), ' ');
        }

        void open(char c) {
            out << c;
            ++level;
            first = true;
        }

        void close(char c) {
            --level;
            if (!first) newline();
            out << c;
            first = false;
        }

        void key(const char* k) {
            if (!first) out << ',';
            newline();
            out << '"' << k << '"' << (indent > 0 ? ": " : ":");
            first = false;
        }

        void element() {
            if (!first) out << ',';
            newline();
            first = false;
        }

        void field(const char* k, const std::string& v) {
            key(k);
            out << escape_json_string(v);
        }

        void field(const char* k, const Date& d) { field(k, d.toString()); }

        void strings(const char* k, const std::vector<std::string>& v) {
            key(k);
            out << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i) out << (indent > 0 ? ", " : ",");
                out << escape_json_string(v[i]);
            }
            out << ']';
        }
    };

    std::string join_non_empty(const std::vector<std::string>& v) {
        std::string out;
        for (auto const& s : v) {
            bool blank = true;
            for (char c : s) {
                if (!std::isspace(static_cast<unsigned char>(c))) {
                    blank = false;
                    break;
                }
            }
            if (blank) continue;
            if (!out.empty()) out += ", ";
            out += s;
        }
        return out;
    }
}  // anonymous namespace

std::optional<Date> Date::parse(const std::string& text) {
    std::string s = text;
    size_t sep = s.find_first_of("T ");
    if (sep != std::string::npos) {
        if (!valid_time(s.substr(sep + 1))) return std::nullopt;
        s = s.substr(0, sep);
    }

    std::vector<std::string> parts;
    bool year_first = true;
    if (s.find('-') != std::string::npos) {
        parts = split(s, '-');
    } else if (s.find('/') != std::string::npos) {
        parts = split(s, '/');
        year_first = !parts.empty() && parts[0].size() == 4;
    } else {
        return std::nullopt;
    }
    if (parts.size() != 3) return std::nullopt;

    Date d;
    const std::string& y = year_first ? parts[0] : parts[2];
    const std::string& m = year_first ? parts[1] : parts[0];
    const std::string& dd = year_first ? parts[2] : parts[1];
    if (!parse_number(y, 4, 4, d.year) || d.year < 1) return std::nullopt;
    if (!parse_number(m, 1, 2, d.month) || d.month < 1 || d.month > 12) return std::nullopt;
    if (!parse_number(dd, 1, 2, d.day) || d.day < 1 || d.day > days_in_month(d.year, d.month))
        return std::nullopt;
    return d;
}

std::string Date::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

bool Record::operator==(const Record& o) const {
    return name == o.name && age == o.age && email == o.email && phone == o.phone &&
           department == o.department && startDate == o.startDate && skills == o.skills &&
           languages == o.languages && address == o.address && projects == o.projects &&
           notes == o.notes;
}

std::string to_json(const Record& r, int indent) {
    JsonWriter w(indent);
    w.open('{');
    w.field("name", r.name);
    w.key("age");
    w.out << r.age;
    w.field("email", r.email);
    if (r.phone) w.field("phone", *r.phone);
    if (r.department) w.field("department", *r.department);
    if (r.startDate) w.field("startDate", *r.startDate);
    w.strings("skills", r.skills);
    w.strings("languages", r.languages);
    if (r.address) {
        w.key("address");
        w.open('{');
        w.field("street", r.address->street);
        w.field("city", r.address->city);
        w.field("state", r.address->state);
        w.field("zipCode", r.address->zipCode);
        w.close('}');
    }
    w.key("projects");
    w.open('[');
    for (auto const& p : r.projects) {
        w.element();
        w.open('{');
        w.field("name", p.name);
        w.field("role", p.role);
        w.field("startDate", p.startDate);
        if (p.endDate) w.field("endDate", *p.endDate);
        w.close('}');
    }
    w.close(']');
    if (r.notes) w.field("notes", *r.notes);
    w.close('}');
    return w.out.str();
}

std::string to_text(const Record& r) {
    std::ostringstream ss;
    ss << "Name: " << r.name << ", Age: " << r.age << ", Email: " << r.email << "\n";
    if (r.phone && !r.phone->empty()) ss << "  Phone: " << *r.phone << "\n";
    if (r.department && !r.department->empty()) ss << "  Department: " << *r.department << "\n";
    if (r.startDate) ss << "  Start Date: " << r.startDate->toString() << "\n";

    std::string skills = join_non_empty(r.skills);
    if (!skills.empty()) ss << "  Skills: " << skills << "\n";
    std::string languages = join_non_empty(r.languages);
    if (!languages.empty()) ss << "  Languages: " << languages << "\n";

    if (r.address) {
        ss << "  Address: " << r.address->street << ", " << r.address->city << ", "
           << r.address->state << " " << r.address->zipCode << "\n";
    }

    size_t named = 0;
    for (auto const& p : r.projects)
        if (!p.name.empty()) ++named;
    if (named > 0) {
        ss << "  Projects (" << named << "):\n";
        for (auto const& p : r.projects) {
            if (p.name.empty()) continue;
            ss << "    - " << p.name << " as " << p.role << " (" << p.startDate.toString() << " to "
               << (p.endDate ? p.endDate->toString() : std::string("Ongoing")) << ")\n";
        }
    }
    if (r.notes && !r.notes->empty()) ss << "  Notes: " << *r.notes << "\n";
    return ss.str();
}

}  // namespace vcsv
