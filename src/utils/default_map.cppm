/**
 * @file default_map.cppm
 * @brief Map whose missing entries are created on first access
 *
 *   default_map<std::string, std::vector<int>> groups([] { return std::vector<int>{}; });
 *   groups.get("a").push_back(1);   // entry created by the factory
 *   groups.remove("a");             // factory not involved
 */
module;

#include <coopmod/config.hpp>

export module coopmod.utils.default_map;

import std;

namespace coopmod {

export template <typename K, typename V, typename Hash = std::hash<K>>
class default_map {
public:
    using factory_fn = std::function<V()>;

    /// @throws std::invalid_argument if factory is empty
    explicit default_map(factory_fn factory)
        : factory_(std::move(factory))
    {
        if (!factory_)
            throw std::invalid_argument("default_map: factory must be callable");
    }

    /// Stored value, created with the factory on first access.
    /// The reference stays valid until the key is removed.
    auto get(const K& key) -> V& {
        if (auto it = map_.find(key); it != map_.end())
            return it->second;
        return map_.emplace(key, factory_()).first->second;
    }

    auto set(const K& key, V value) -> V& {
        return map_.insert_or_assign(key, std::move(value)).first->second;
    }

    /// @return whether an entry existed
    auto remove(const K& key) -> bool {
        return map_.erase(key) > 0;
    }

    [[nodiscard]] auto contains(const K& key) const -> bool {
        return map_.contains(key);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return map_.size(); }

private:
    factory_fn factory_;
    std::unordered_map<K, V, Hash> map_;
};

} // namespace coopmod
