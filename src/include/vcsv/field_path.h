#pragma once

#include <string>

namespace vcsv {

// A column or row label interpreted as the location of a value:
//   name               Scalar
//   Skills[2]          Array
//   Address.City       Object
//   Projects[1].Role   ArrayOfObject
// Base and member names are lower-cased; indices are non-negative decimal
// integers. Anything else classifies as Unrecognized.
class FieldPath {
public:
    enum class Kind { Scalar, Array, Object, ArrayOfObject, Unrecognized };

    static FieldPath parse(const std::string& label);

    Kind kind() const { return kind_; }
    bool isScalar() const { return kind_ == Kind::Scalar; }
    bool isArray() const { return kind_ == Kind::Array; }
    bool isObject() const { return kind_ == Kind::Object; }
    bool isArrayOfObject() const { return kind_ == Kind::ArrayOfObject; }
    bool isRecognized() const { return kind_ != Kind::Unrecognized; }

    // Lower-cased name before any '[' or '.'.
    const std::string& base() const { return base_; }
    // Lower-cased name after the '.', empty for Scalar and Array.
    const std::string& member() const { return member_; }
    // Throws std::logic_error unless the path carries an index.
    int index() const;

private:
    FieldPath(Kind kind, std::string base, std::string member, int index);

    Kind kind_;
    std::string base_;
    std::string member_;
    int index_;
};

// ASCII lower-casing used for every name comparison.
std::string to_lower(const std::string& s);

}  // namespace vcsv
