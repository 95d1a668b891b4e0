#include "arincdelta/schemas.hpp"
#include "arincdelta/record.hpp"

namespace arincdelta::schemas {

void trim_field(Row& row, const std::string& name) {
    auto it = row.find(name);
    if (it != row.end() && !it->second.empty()) {
        it->second = trim(it->second);
    }
}

// Keep the first `width` characters of an over-wide identifier
void clip_ident(Row& row, const std::string& name, size_t width) {
    auto it = row.find(name);
    if (it != row.end() && !it->second.empty()) {
        it->second = trim(it->second.substr(0, width));
    }
}

} // namespace arincdelta::schemas
