#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

// Raw scalar as received from the caller. std::monostate marks null.
using RawScalar = std::variant<std::monostate, bool, double, std::string>;

struct RecordField {
    std::string name;
    RawScalar value;
};

// Ordered field-name -> scalar mapping. Field order is not guaranteed to match across records.
using Record = std::vector<RecordField>;

inline bool isNull(const RawScalar& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

inline const RawScalar* findField(const Record& record, const std::string& name) {
    for (const auto& field : record) {
        if (field.name == name) return &field.value;
    }
    return nullptr;
}
