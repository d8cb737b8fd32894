#include <vcsv/field_path.h>
#include <cctype>
#include <stdexcept>

namespace vcsv {

namespace {
    // Digits only; at most nine of them so the value always fits an int.
    bool isArrayIndex(const std::string& segment) {
        if (segment.empty() || segment.size() > 9) {
            return false;
        }
        for (char c : segment) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }
}  // anonymous namespace

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

FieldPath::FieldPath(Kind kind, std::string base, std::string member, int index)
    : kind_(kind), base_(std::move(base)), member_(std::move(member)), index_(index) {}

int FieldPath::index() const {
    if (kind_ != Kind::Array && kind_ != Kind::ArrayOfObject) {
        throw std::logic_error("FieldPath has no index");
    }
    return index_;
}

FieldPath FieldPath::parse(const std::string& label) {
    const std::string lower = to_lower(label);
    const FieldPath unrecognized(Kind::Unrecognized, lower, "", -1);
    if (lower.empty()) {
        return unrecognized;
    }

    size_t open = lower.find('[');
    if (open != std::string::npos) {
        std::string base = lower.substr(0, open);
        size_t close = lower.find(']', open);
        if (base.empty() || base.find('.') != std::string::npos || close == std::string::npos) {
            return unrecognized;
        }
        std::string digits = lower.substr(open + 1, close - open - 1);
        if (!isArrayIndex(digits)) {
            return unrecognized;
        }
        int index = std::stoi(digits);

        std::string rest = lower.substr(close + 1);
        if (rest.empty()) {
            return FieldPath(Kind::Array, base, "", index);
        }
        if (rest.size() > 1 && rest[0] == '.') {
            return FieldPath(Kind::ArrayOfObject, base, rest.substr(1), index);
        }
        return unrecognized;
    }

    size_t dot = lower.find('.');
    if (dot != std::string::npos) {
        if (dot == 0 || dot + 1 == lower.size()) {
            return unrecognized;
        }
        return FieldPath(Kind::Object, lower.substr(0, dot), lower.substr(dot + 1), -1);
    }

    return FieldPath(Kind::Scalar, lower, "", -1);
}

}  // namespace vcsv
