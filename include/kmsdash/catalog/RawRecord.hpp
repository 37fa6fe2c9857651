#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace KD {

struct RawRecord;

// Scalar value at the bottom of a product database tree.
struct RawLeaf {
    using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    Value value{};

    [[nodiscard]] auto is_null() const -> bool { return std::holds_alternative<std::monostate>(value); }
    [[nodiscard]] auto as_string() const -> std::string const* { return std::get_if<std::string>(&value); }
};

struct RawSequence {
    std::vector<RawRecord> items;
};

// Keyed node. Keys keep their document order; lookups return the first match.
struct RawMapping {
    std::vector<std::string> keys;
    std::vector<RawRecord>   values;

    void               insert(std::string key, RawRecord value);
    [[nodiscard]] auto find(std::string_view key) const -> RawRecord const*;
    [[nodiscard]] auto contains(std::string_view key) const -> bool { return find(key) != nullptr; }
    [[nodiscard]] auto size() const -> std::size_t { return keys.size(); }
};

struct RawRecord {
    using Node = std::variant<RawLeaf, RawSequence, RawMapping>;

    Node node{};

    RawRecord() = default;
    RawRecord(RawLeaf leaf)
        : node(std::move(leaf)) {}
    RawRecord(RawSequence sequence)
        : node(std::move(sequence)) {}
    RawRecord(RawMapping mapping)
        : node(std::move(mapping)) {}

    static auto null() -> RawRecord { return RawRecord{RawLeaf{}}; }
    static auto string(std::string value) -> RawRecord { return RawRecord{RawLeaf{std::move(value)}}; }
    static auto integer(std::int64_t value) -> RawRecord { return RawRecord{RawLeaf{value}}; }
    static auto sequence(std::vector<RawRecord> items) -> RawRecord {
        return RawRecord{RawSequence{std::move(items)}};
    }
    static auto mapping(std::initializer_list<std::pair<std::string, RawRecord>> fields) -> RawRecord;

    [[nodiscard]] auto as_leaf() const -> RawLeaf const* { return std::get_if<RawLeaf>(&node); }
    [[nodiscard]] auto as_sequence() const -> RawSequence const* { return std::get_if<RawSequence>(&node); }
    [[nodiscard]] auto as_mapping() const -> RawMapping const* { return std::get_if<RawMapping>(&node); }
};

} // namespace KD
