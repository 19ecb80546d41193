#include "esrdecoder/field_info.hpp"

#include "util/bit_ops.hpp"

#include <bitset>
#include <iomanip>
#include <sstream>

namespace esrdecoder {

FieldInfo FieldInfo::Get(uint64_t reg, std::string_view name, std::optional<std::string_view> longName, size_t start,
                         size_t end) {
    return FieldInfo{
        .name = name,
        .longName = longName,
        .start = start,
        .width = end - start,
        .value = bit::extract(reg, start, end),
        .description = std::nullopt,
        .subfields = {},
    };
}

FieldInfo FieldInfo::GetBit(uint64_t reg, std::string_view name, std::optional<std::string_view> longName,
                            size_t bit) {
    return Get(reg, name, longName, bit, bit + 1);
}

FieldInfo FieldInfo::WithDescription(std::string description) const {
    FieldInfo field = *this;
    field.description = std::move(description);
    return field;
}

FieldInfo FieldInfo::WithSubfields(std::vector<FieldInfo> subfields) const {
    FieldInfo field = *this;
    field.subfields = std::move(subfields);
    return field;
}

bool FieldInfo::AsBit() const {
    assert(width == 1 && "Not a single-bit field");
    return value == 1;
}

FieldInfo FieldInfo::DescribeBit(BitDescriber describer) const {
    return WithDescription(describer(AsBit()));
}

FieldInfo FieldInfo::Describe(ValueDescriber describer) const {
    return WithDescription(describer(value));
}

Result<FieldInfo> FieldInfo::Describe(FallibleDescriber describer) const {
    ESRDECODER_TRY(text, describer(value));
    return WithDescription(text);
}

Result<FieldInfo> FieldInfo::CheckRes0() const {
    if (value != 0) {
        return DecodeError{DecodeErrorKind::InvalidRes0, value};
    }
    return *this;
}

std::string FieldInfo::ValueString() const {
    if (width == 1) {
        return (value == 1) ? "true" : "false";
    }
    std::ostringstream oss;
    oss << "0x" << std::setfill('0') << std::setw((width + 3) / 4) << std::right << std::hex << value;
    return oss.str();
}

std::string FieldInfo::ValueBinaryString() const {
    return "0b" + std::bitset<64>(value).to_string().substr(64 - width);
}

std::string FieldInfo::ToString() const {
    std::string str{name};
    if (width == 1) {
        str += ": ";
        str += ValueString();
    } else {
        str += ": " + ValueString() + " " + ValueBinaryString();
    }
    return str;
}

std::ostream &operator<<(std::ostream &os, const FieldInfo &field) {
    return os << field.ToString();
}

} // namespace esrdecoder
