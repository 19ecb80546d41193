#include "printer.hpp"

#include <cstdio>
#include <string>

namespace esrdecoder::cli {

void PrintFields(const std::vector<FieldInfo> &fields, bool verbose, size_t level) {
    const std::string indentation(level * 2, ' ');
    for (auto &field : fields) {
        const auto text = field.ToString();
        if (field.width == 1) {
            printf("%s%02zu     %s", indentation.c_str(), field.start, text.c_str());
        } else {
            printf("%s%02zu..%02zu %s", indentation.c_str(), field.start, field.start + field.width - 1, text.c_str());
        }
        if (verbose && field.longName) {
            printf(" (%.*s)", static_cast<int>(field.longName->size()), field.longName->data());
        }
        printf("\n");

        if (field.description) {
            printf("%s  # %s\n", indentation.c_str(), field.description->c_str());
        }
        PrintFields(field.subfields, verbose, level + 1);
    }
}

} // namespace esrdecoder::cli
