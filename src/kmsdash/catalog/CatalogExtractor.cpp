#include <kmsdash/catalog/CatalogExtractor.hpp>

#include <kmsdash/log/TaggedLogger.hpp>

#include <string>
#include <utility>
#include <variant>

namespace KD {

void ProductCatalog::upsert(ProductCatalogEntry entry) {
    auto it = index_.find(entry.display_name);
    if (it != index_.end()) {
        entries_[it->second] = std::move(entry);
        return;
    }
    index_.emplace(entry.display_name, entries_.size());
    entries_.push_back(std::move(entry));
}

auto ProductCatalog::find(std::string_view display_name) const -> ProductCatalogEntry const* {
    auto it = index_.find(std::string{display_name});
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

namespace {

auto make_skip(std::string const& path, std::string_view reason) -> Error {
    std::string message{reason};
    message.append(" at ");
    message.append(path.empty() ? std::string{"$"} : path);
    return Error{Error::Code::ExtractionSkipped, std::move(message)};
}

class CatalogWalker {
public:
    CatalogWalker(ServerConfig const& config, CatalogSchema const& schema, CatalogLogHooks const& hooks)
        : config_(config)
        , schema_(schema)
        , hooks_(hooks) {}

    auto walk(RawRecord const& node, std::size_t depth, std::string const& path) -> Expected<void>;

    void report(Error const& error) const {
        kd_log(describeError(error), "Catalog", "Skip");
        if (hooks_.skipped) {
            hooks_.skipped(error);
        }
    }

    auto take() -> ProductCatalog { return std::move(catalog_); }

private:
    struct NodeVisitor {
        CatalogWalker&     walker;
        std::size_t        depth;
        std::string const& path;

        auto operator()(RawLeaf const&) const -> Expected<void> { return {}; }
        auto operator()(RawSequence const& sequence) const -> Expected<void>;
        auto operator()(RawMapping const& mapping) const -> Expected<void>;
    };

    // Children are walked one at a time; a malformed child is reported and dropped.
    void descend(RawRecord const& child, std::size_t depth, std::string const& path) {
        auto status = walk(child, depth, path);
        if (!status) {
            report(status.error());
        }
    }

    auto emit_entry(RawRecord const& key_node, RawRecord const& name_node, std::string const& path)
        -> Expected<void>;

    ServerConfig const&    config_;
    CatalogSchema const&   schema_;
    CatalogLogHooks const& hooks_;
    ProductCatalog         catalog_;
};

auto CatalogWalker::walk(RawRecord const& node, std::size_t depth, std::string const& path)
    -> Expected<void> {
    if (depth > schema_.max_depth) {
        return std::unexpected(make_skip(path, "nesting exceeds " + std::to_string(schema_.max_depth) + " levels"));
    }
    return std::visit(NodeVisitor{*this, depth, path}, node.node);
}

auto CatalogWalker::NodeVisitor::operator()(RawSequence const& sequence) const -> Expected<void> {
    for (std::size_t i = 0; i < sequence.items.size(); ++i) {
        walker.descend(sequence.items[i], depth + 1, path + "[" + std::to_string(i) + "]");
    }
    return {};
}

auto CatalogWalker::NodeVisitor::operator()(RawMapping const& mapping) const -> Expected<void> {
    auto const& schema = walker.schema_;
    if (auto const* child_items = mapping.find(schema.child_items_key)) {
        walker.descend(*child_items, depth + 1, path + "/" + schema.child_items_key);
        return {};
    }
    if (auto const* sub_items = mapping.find(schema.sub_items_key)) {
        walker.descend(*sub_items, depth + 1, path + "/" + schema.sub_items_key);
        return {};
    }
    auto const* key_node  = mapping.find(schema.license_key_field);
    auto const* name_node = mapping.find(schema.display_name_field);
    if (key_node == nullptr || name_node == nullptr) {
        return {};
    }
    return walker.emit_entry(*key_node, *name_node, path);
}

auto CatalogWalker::emit_entry(RawRecord const&   key_node,
                               RawRecord const&   name_node,
                               std::string const& path) -> Expected<void> {
    auto const* key_leaf = key_node.as_leaf();
    if (key_leaf == nullptr) {
        return std::unexpected(make_skip(path, schema_.license_key_field + " is not a scalar"));
    }
    if (key_leaf->is_null()) {
        return {};
    }
    auto const* key = key_leaf->as_string();
    if (key == nullptr) {
        return std::unexpected(make_skip(path, schema_.license_key_field + " is not a string"));
    }
    if (key->empty()) {
        return {};
    }

    auto const* name_leaf = name_node.as_leaf();
    auto const* name      = name_leaf != nullptr ? name_leaf->as_string() : nullptr;
    if (name == nullptr) {
        return std::unexpected(make_skip(path, schema_.display_name_field + " is not a string"));
    }

    ProductCatalogEntry entry{};
    entry.display_name = *name;
    entry.license_key  = *key;
    entry.commands     = GenerateCommands(entry.display_name, entry.license_key, config_);
    catalog_.upsert(std::move(entry));
    return {};
}

} // namespace

auto ExtractCatalog(RawRecord const&       root,
                    ServerConfig const&    config,
                    CatalogSchema const&   schema,
                    CatalogLogHooks const& hooks) -> ProductCatalog {
    CatalogWalker walker{config, schema, hooks};
    auto          status = walker.walk(root, 0, std::string{});
    if (!status) {
        walker.report(status.error());
    }
    return walker.take();
}

} // namespace KD
