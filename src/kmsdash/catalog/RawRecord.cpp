#include <kmsdash/catalog/RawRecord.hpp>

namespace KD {

void RawMapping::insert(std::string key, RawRecord value) {
    keys.push_back(std::move(key));
    values.push_back(std::move(value));
}

auto RawMapping::find(std::string_view key) const -> RawRecord const* {
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (keys[i] == key) {
            return &values[i];
        }
    }
    return nullptr;
}

auto RawRecord::mapping(std::initializer_list<std::pair<std::string, RawRecord>> fields) -> RawRecord {
    RawMapping result;
    result.keys.reserve(fields.size());
    result.values.reserve(fields.size());
    for (auto const& field : fields) {
        result.insert(field.first, field.second);
    }
    return RawRecord{std::move(result)};
}

} // namespace KD
