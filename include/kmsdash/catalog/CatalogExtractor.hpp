#pragma once

#include <kmsdash/catalog/CommandGenerator.hpp>
#include <kmsdash/catalog/RawRecord.hpp>
#include <kmsdash/config/ServerConfig.hpp>
#include <kmsdash/core/Error.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace KD {

struct ProductCatalogEntry {
    std::string display_name;
    std::string license_key;
    CommandSet  commands;
};

// Display name -> entry. Iteration follows first insertion; a later upsert of an
// existing name replaces the entry in place.
class ProductCatalog {
public:
    using const_iterator = std::vector<ProductCatalogEntry>::const_iterator;

    void upsert(ProductCatalogEntry entry);

    [[nodiscard]] auto find(std::string_view display_name) const -> ProductCatalogEntry const*;
    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries_.empty(); }
    [[nodiscard]] auto begin() const -> const_iterator { return entries_.begin(); }
    [[nodiscard]] auto end() const -> const_iterator { return entries_.end(); }

private:
    std::vector<ProductCatalogEntry>             entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

struct CatalogSchema {
    std::string child_items_key{"KmsItems"};
    std::string sub_items_key{"SkuItems"};
    std::string license_key_field{"Gvlk"};
    std::string display_name_field{"DisplayName"};
    std::size_t max_depth{256};
};

struct CatalogLogHooks {
    std::function<void(Error const&)> skipped;
};

// Depth-first flattening of a product database tree. Malformed subtrees are
// reported through hooks.skipped and left out; extraction itself never fails.
[[nodiscard]] auto ExtractCatalog(RawRecord const&       root,
                                  ServerConfig const&    config,
                                  CatalogSchema const&   schema = {},
                                  CatalogLogHooks const& hooks  = {}) -> ProductCatalog;

} // namespace KD
