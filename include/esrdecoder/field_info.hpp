#pragma once

#include "esrdecoder/util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace esrdecoder {

// Information about a particular field of a register, or of another field.
struct FieldInfo {
    std::string_view name;                    // Short name, e.g. "ISS"
    std::optional<std::string_view> longName; // Long name, e.g. "Instruction Specific Syndrome"
    size_t start;                             // Index of the lowest bit of the field
    size_t width;                             // Number of bits in the field
    uint64_t value;                           // Value of the field
    std::optional<std::string> description;   // Explanation of the field's value, if available
    std::vector<FieldInfo> subfields;         // Breakdown of the field's value, if it has any structure

    using BitDescriber = const char *(*)(bool);
    using ValueDescriber = const char *(*)(uint64_t);
    using FallibleDescriber = Result<const char *> (*)(uint64_t);

    // Extracts bits [start, end) of the register into a new field.
    static FieldInfo Get(uint64_t reg, std::string_view name, std::optional<std::string_view> longName, size_t start,
                         size_t end);

    // Extracts a single bit of the register into a new field.
    static FieldInfo GetBit(uint64_t reg, std::string_view name, std::optional<std::string_view> longName, size_t bit);

    FieldInfo WithDescription(std::string description) const;
    FieldInfo WithSubfields(std::vector<FieldInfo> subfields) const;

    // Returns the value of a single-bit field as a boolean.
    // The field must be exactly one bit wide.
    bool AsBit() const;

    // Describes a single-bit field with the given function.
    // The field must be exactly one bit wide.
    FieldInfo DescribeBit(BitDescriber describer) const;

    FieldInfo Describe(ValueDescriber describer) const;

    // Describes the field with a classifier that may reject the value, in which case the classifier's error is
    // returned unchanged.
    Result<FieldInfo> Describe(FallibleDescriber describer) const;

    // Fails with DecodeErrorKind::InvalidRes0 if the field is not zero.
    Result<FieldInfo> CheckRes0() const;

    // Returns the value as a hexadecimal string, or "true" or "false" if it is a single bit.
    std::string ValueString() const;

    // Returns the value as a binary string.
    std::string ValueBinaryString() const;

    std::string ToString() const;

    bool operator==(const FieldInfo &) const = default;
};

std::ostream &operator<<(std::ostream &os, const FieldInfo &field);

} // namespace esrdecoder
