#pragma once

/** \file suffix_tree.hpp
 *  \brief Substring search over std::string values.
 *
 * Every suffix of every indexed string (one per byte offset, including the
 * empty suffix) is kept in an ordered map. A string contains a pattern iff one
 * of its suffixes starts with the pattern, so a substring query is a prefix
 * scan from lower_bound(pattern). Strings are treated as raw bytes; UTF-8 text
 * and invalid byte sequences are matched alike.
 *
 * Suffixes share the record's bytes through one shared_ptr per inserted
 * string. Insert/remove cost O(L log n) for a string of L bytes.
 */

#include <algorithm>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "tessera/core/ops.hpp"
#include "tessera/keyset.hpp"
#include "tessera/query_result.hpp"

namespace tessera::index {

template <class KeySet = keyset::hash_set>
class SuffixTree : public core::remove_then_insert<SuffixTree<KeySet>> {
    struct suffix {
        std::shared_ptr<const std::string> base;
        std::size_t offset;

        [[nodiscard]] auto view() const -> std::string_view {
            return std::string_view(*base).substr(offset);
        }
    };

    struct suffix_less {
        using is_transparent = void;
        auto operator()(const suffix& a, const suffix& b) const -> bool { return a.view() < b.view(); }
        auto operator()(const suffix& a, std::string_view b) const -> bool { return a.view() < b; }
        auto operator()(std::string_view a, const suffix& b) const -> bool { return a < b.view(); }
    };

public:
    static constexpr bool shallow_clonable = false;

    void insert(Seal, const Insert<std::string>& op) {
        auto base = std::make_shared<const std::string>(op.new_value);
        for (std::size_t off = 0; off <= base->size(); ++off) {
            const std::string_view tail = std::string_view(*base).substr(off);
            auto it = suffixes_.find(tail);
            if (it == suffixes_.end()) it = suffixes_.emplace(suffix{base, off}, KeySet{}).first;
            it->second.insert(op.key);
        }
    }

    void remove(Seal, const Remove<std::string>& op) {
        const std::string_view s = op.existing;
        for (std::size_t off = 0; off <= s.size(); ++off) {
            auto it = suffixes_.find(s.substr(off));
            if (it == suffixes_.end()) continue;
            it->second.remove(op.key);
            if (it->second.empty()) suffixes_.erase(it);
        }
    }

    /** \brief Keys of every string containing pattern. The empty pattern matches all. */
    [[nodiscard]] auto contains_get_all(std::string_view pattern) const -> UniqueKeys {
        UniqueKeys out;
        for (auto it = suffixes_.lower_bound(pattern);
             it != suffixes_.end() && it->first.view().starts_with(pattern); ++it) {
            it->second.for_each([&](Key k) { out.keys.push_back(k); });
        }
        // One string can match through several of its suffixes.
        std::sort(out.keys.begin(), out.keys.end());
        out.keys.erase(std::unique(out.keys.begin(), out.keys.end()), out.keys.end());
        return out;
    }

    /** \brief A key of some string containing pattern. */
    [[nodiscard]] auto contains_get_one(std::string_view pattern) const -> std::optional<Key> {
        auto it = suffixes_.lower_bound(pattern);
        if (it == suffixes_.end() || !it->first.view().starts_with(pattern)) return std::nullopt;
        return it->second.first();
    }

    /** \brief Keys of every string ending with tail. */
    [[nodiscard]] auto ends_with(std::string_view tail) const -> UniqueKeys {
        UniqueKeys out;
        auto it = suffixes_.find(tail);
        if (it != suffixes_.end()) it->second.for_each([&](Key k) { out.keys.push_back(k); });
        return out;
    }

    /** \brief Number of distinct suffixes held. */
    [[nodiscard]] auto suffix_count() const noexcept -> std::size_t { return suffixes_.size(); }

private:
    std::map<suffix, KeySet, suffix_less> suffixes_;
};

} // namespace tessera::index
