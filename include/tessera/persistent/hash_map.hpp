#pragma once

/** \file hash_map.hpp
 *  \brief Persistent hash map: an ordered_map from hash to a small bucket.
 *
 * Buckets are copied on write; with a reasonable hash they hold one entry.
 * Iteration order follows hash values and is otherwise unspecified.
 */

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "tessera/persistent/ordered_map.hpp"

namespace tessera::persistent {

template <class K, class V, class Hash = std::hash<K>, class Eq = std::equal_to<K>>
class hash_map {
    using bucket = std::vector<std::pair<K, V>>;

public:
    using key_type = K;
    using mapped_type = V;

    static constexpr bool shallow_clonable = true;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return size_ == 0; }

    [[nodiscard]] auto find(const K& k) const -> const V* {
        const bucket* b = buckets_.find(hash_(k));
        if (b == nullptr) return nullptr;
        for (const auto& entry : *b) {
            if (eq_(entry.first, k)) return &entry.second;
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const K& k) const -> bool { return find(k) != nullptr; }

    auto insert_or_assign(K k, V v) -> bool {
        const std::size_t h = hash_(k);
        const bucket* existing = buckets_.find(h);
        bucket next = existing ? *existing : bucket{};
        for (auto& entry : next) {
            if (eq_(entry.first, k)) {
                entry.second = std::move(v);
                buckets_.insert_or_assign(h, std::move(next));
                return false;
            }
        }
        next.emplace_back(std::move(k), std::move(v));
        buckets_.insert_or_assign(h, std::move(next));
        ++size_;
        return true;
    }

    auto erase(const K& k) -> bool {
        const std::size_t h = hash_(k);
        const bucket* existing = buckets_.find(h);
        if (existing == nullptr) return false;
        bucket next;
        next.reserve(existing->size());
        bool erased = false;
        for (const auto& entry : *existing) {
            if (!erased && eq_(entry.first, k)) {
                erased = true;
            } else {
                next.push_back(entry);
            }
        }
        if (!erased) return false;
        if (next.empty()) {
            buckets_.erase(h);
        } else {
            buckets_.insert_or_assign(h, std::move(next));
        }
        --size_;
        return true;
    }

    template <class F>
    void for_each(F&& f) const {
        buckets_.for_each([&](std::size_t, const bucket& b) {
            for (const auto& entry : b) std::invoke(f, entry.first, entry.second);
        });
    }

private:
    ordered_map<std::size_t, bucket> buckets_;
    std::size_t size_{0};
    [[no_unique_address]] Hash hash_{};
    [[no_unique_address]] Eq eq_{};
};

} // namespace tessera::persistent
