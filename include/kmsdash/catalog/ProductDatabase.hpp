#pragma once

#include <kmsdash/catalog/RawRecord.hpp>
#include <kmsdash/core/Error.hpp>

#include <cstddef>
#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace KD {

inline constexpr std::size_t kMaxProductDatabaseDepth = 256;

// Converts a JSON document into an untyped record tree, keeping object key order.
// Containers nested deeper than max_depth are MalformedInput; no record deeper
// than the limit is ever built.
[[nodiscard]] auto RawRecordFromJson(nlohmann::ordered_json const& value,
                                     std::size_t max_depth = kMaxProductDatabaseDepth) -> Expected<RawRecord>;

[[nodiscard]] auto ParseProductDatabase(std::string_view text) -> Expected<RawRecord>;

// NotFound when the file is missing, IoFailure when unreadable, MalformedInput
// when it is not valid JSON or nests too deeply.
[[nodiscard]] auto LoadProductDatabase(std::filesystem::path const& path) -> Expected<RawRecord>;

} // namespace KD
