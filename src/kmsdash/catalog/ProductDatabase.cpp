#include <kmsdash/catalog/ProductDatabase.hpp>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace KD {

namespace {

using json = nlohmann::ordered_json;

auto convert(json const& value, std::size_t depth, std::size_t max_depth) -> Expected<RawRecord> {
    if ((value.is_array() || value.is_object()) && depth >= max_depth) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "product database nests deeper than " + std::to_string(max_depth) + " levels"});
    }
    switch (value.type()) {
    case json::value_t::array: {
        RawSequence sequence;
        sequence.items.reserve(value.size());
        for (auto const& item : value) {
            auto child = convert(item, depth + 1, max_depth);
            if (!child) {
                return std::unexpected(child.error());
            }
            sequence.items.push_back(std::move(*child));
        }
        return RawRecord{std::move(sequence)};
    }
    case json::value_t::object: {
        RawMapping mapping;
        mapping.keys.reserve(value.size());
        mapping.values.reserve(value.size());
        for (auto it = value.begin(); it != value.end(); ++it) {
            auto child = convert(it.value(), depth + 1, max_depth);
            if (!child) {
                return std::unexpected(child.error());
            }
            mapping.insert(it.key(), std::move(*child));
        }
        return RawRecord{std::move(mapping)};
    }
    case json::value_t::string:
        return RawRecord{RawLeaf{value.get<std::string>()}};
    case json::value_t::boolean:
        return RawRecord{RawLeaf{value.get<bool>()}};
    case json::value_t::number_integer:
        return RawRecord{RawLeaf{value.get<std::int64_t>()}};
    case json::value_t::number_unsigned:
        return RawRecord{RawLeaf{static_cast<std::int64_t>(value.get<std::uint64_t>())}};
    case json::value_t::number_float:
        return RawRecord{RawLeaf{value.get<double>()}};
    case json::value_t::null:
    case json::value_t::binary:
    case json::value_t::discarded:
        break;
    }
    return RawRecord::null();
}

} // namespace

auto RawRecordFromJson(nlohmann::ordered_json const& value, std::size_t max_depth) -> Expected<RawRecord> {
    return convert(value, 0, max_depth);
}

auto ParseProductDatabase(std::string_view text) -> Expected<RawRecord> {
    auto parsed = nlohmann::ordered_json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "product database is not valid JSON"});
    }
    return RawRecordFromJson(parsed);
}

auto LoadProductDatabase(std::filesystem::path const& path) -> Expected<RawRecord> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(Error{Error::Code::NotFound, "product database not found: " + path.string()});
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot open product database: " + path.string()});
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed reading product database: " + path.string()});
    }
    return ParseProductDatabase(buffer.str());
}

} // namespace KD
