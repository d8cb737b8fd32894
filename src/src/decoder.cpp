#include <vcsv/decoder.h>
#include <vcsv/tokenizer.h>

#include <charconv>
#include <unordered_map>

namespace vcsv {

namespace {
    using Setter = void (RecordBuilder::*)(const std::string&);

    // Lower-cased top-level label -> setter. Built on first use.
    const std::unordered_map<std::string, Setter>& scalar_setters() {
        static const std::unordered_map<std::string, Setter> table = {
            {"name", &RecordBuilder::setName},
            {"age", &RecordBuilder::setAge},
            {"email", &RecordBuilder::setEmail},
            {"phone", &RecordBuilder::setPhone},
            {"department", &RecordBuilder::setDepartment},
            {"startdate", &RecordBuilder::setStartDate},
            {"notes", &RecordBuilder::setNotes},
        };
        return table;
    }

    template <typename T>
    std::vector<T> densify(const std::map<int, T>& sparse) {
        std::vector<T> out;
        if (sparse.empty()) return out;
        out.resize(static_cast<size_t>(sparse.rbegin()->first) + 1);
        for (auto const& kv : sparse) out[static_cast<size_t>(kv.first)] = kv.second;
        return out;
    }
}  // anonymous namespace

void RecordBuilder::setAge(const std::string& v) {
    const char* first = v.data();
    const char* last = v.data() + v.size();
    if (first != last && *first == '+') ++first;
    if (first == last || *first == '-') return;

    int age = 0;
    auto res = std::from_chars(first, last, age);
    if (res.ec != std::errc() || res.ptr != last) return;
    record_.age = age;
}

void RecordBuilder::setStartDate(const std::string& v) {
    if (auto d = Date::parse(v)) record_.startDate = *d;
}

void RecordBuilder::set(const std::string& label, const std::string& value) {
    set(FieldPath::parse(label), value);
}

void RecordBuilder::set(const FieldPath& path, const std::string& value) {
    switch (path.kind()) {
        case FieldPath::Kind::Scalar: {
            if (is_blank(value)) return;
            auto const& table = scalar_setters();
            auto it = table.find(path.base());
            if (it != table.end()) (this->*(it->second))(value);
            return;
        }
        case FieldPath::Kind::Array:
            if (path.base() == "skills")
                setListItem(skills_, path.index(), value);
            else if (path.base() == "languages")
                setListItem(languages_, path.index(), value);
            return;
        case FieldPath::Kind::Object:
            if (path.base() == "address") setAddressField(path.member(), value);
            return;
        case FieldPath::Kind::ArrayOfObject:
            if (path.base() == "projects") setProjectField(path.index(), path.member(), value);
            return;
        case FieldPath::Kind::Unrecognized:
            return;
    }
}

// The index counts as referenced even when the value is blank.
void RecordBuilder::setListItem(std::map<int, std::string>& list, int index, const std::string& value) {
    std::string& slot = list[index];
    if (!is_blank(value)) slot = value;
}

void RecordBuilder::setAddressField(const std::string& member, const std::string& value) {
    if (is_blank(value)) return;
    if (!record_.address) record_.address.emplace();

    Address& a = *record_.address;
    if (member == "street")
        a.street = value;
    else if (member == "city")
        a.city = value;
    else if (member == "state")
        a.state = value;
    else if (member == "zipcode")
        a.zipCode = value;
}

void RecordBuilder::setProjectField(int index, const std::string& member, const std::string& value) {
    Project& p = projects_[index];
    if (is_blank(value)) return;

    if (member == "name") {
        p.name = value;
    } else if (member == "role") {
        p.role = value;
    } else if (member == "startdate") {
        if (auto d = Date::parse(value)) p.startDate = *d;
    } else if (member == "enddate") {
        if (auto d = Date::parse(value)) p.endDate = *d;
    }
}

Record RecordBuilder::finish() {
    record_.skills = densify(skills_);
    record_.languages = densify(languages_);
    record_.projects = densify(projects_);
    return std::move(record_);
}

bool is_known_label(const std::string& label) {
    FieldPath path = FieldPath::parse(label);
    switch (path.kind()) {
        case FieldPath::Kind::Scalar:
            return scalar_setters().count(path.base()) > 0;
        case FieldPath::Kind::Array:
            return path.base() == "skills" || path.base() == "languages";
        case FieldPath::Kind::Object:
            return path.base() == "address";
        case FieldPath::Kind::ArrayOfObject:
            return path.base() == "projects";
        case FieldPath::Kind::Unrecognized:
            break;
    }
    return false;
}

Record decode(const RawRecord& raw) {
    RecordBuilder builder;
    for (auto const& [label, value] : raw) {
        builder.set(label, value);
    }
    return builder.finish();
}

}  // namespace vcsv
