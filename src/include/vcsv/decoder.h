#pragma once

#include <vcsv/field_path.h>
#include <vcsv/record.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace vcsv {

// Flat (label, value) pairs for one record, in input order.
using RawRecord = std::vector<std::pair<std::string, std::string>>;

// Accumulates (label, value) writes for a single record and produces the
// finished Record. Decoding does not depend on any schema: every recognized
// label is honored, unrecognized labels are dropped and blank values never
// overwrite anything.
//
// Indexed lists are kept sparse until finish(), which fills every index
// below the highest one referenced with an empty placeholder.
class RecordBuilder {
public:
    RecordBuilder() = default;

    void set(const std::string& label, const std::string& value);
    void set(const FieldPath& path, const std::string& value);

    Record finish();

    // Setters reached through the scalar and member lookup tables.
    void setName(const std::string& v) { record_.name = v; }
    void setAge(const std::string& v);
    void setEmail(const std::string& v) { record_.email = v; }
    void setPhone(const std::string& v) { record_.phone = v; }
    void setDepartment(const std::string& v) { record_.department = v; }
    void setStartDate(const std::string& v);
    void setNotes(const std::string& v) { record_.notes = v; }

private:
    void setListItem(std::map<int, std::string>& list, int index, const std::string& value);
    void setAddressField(const std::string& member, const std::string& value);
    void setProjectField(int index, const std::string& member, const std::string& value);

    Record record_;
    std::map<int, std::string> skills_;
    std::map<int, std::string> languages_;
    std::map<int, Project> projects_;
};

// True if `label` names a field the decoder writes (scalar or structural,
// any case).
bool is_known_label(const std::string& label);

// Decodes one raw record in a single pass.
Record decode(const RawRecord& raw);

}  // namespace vcsv
