#pragma once

/** \file grouped.hpp
 *  \brief Partition records by a group key, one inner index per group.
 *
 * Groups are created on the first insert into them and dropped as soon as
 * their last record leaves, so memory tracks the number of non-empty groups.
 * Each group pairs the inner index with a live-record Count.
 *
 * When an update moves a record to another group, the old group sees Remove
 * and the new group sees Insert. Group iteration order is unspecified.
 *
 * With a persistent Backing every change copies the affected group, so the
 * inner index must be shallow-clonable; this is checked at compile time.
 */

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

#include "tessera/aggregation/count.hpp"
#include "tessera/backing.hpp"
#include "tessera/core/diagnostics.hpp"
#include "tessera/core/ops.hpp"
#include "tessera/core/shallow_clone.hpp"
#include "tessera/index/zip.hpp"

namespace tessera::index {

template <class GroupKey, class KeyFn, class MakeFn, class Backing = backing::std_hash>
class Grouped {
public:
    using inner_type = std::invoke_result_t<MakeFn&>;
    using group_type = Zip<inner_type, aggregation::Count<std::size_t>>;
    using map_type = typename Backing::template map<GroupKey, group_type>;

    static constexpr bool shallow_clonable = map_type::shallow_clonable && is_shallow_clone_v<inner_type>;

    // A persistent group table copies the touched group on every mutation.
    static_assert(!map_type::shallow_clonable || is_shallow_clone_v<inner_type>,
                  "a persistent group table needs a shallow-clonable inner index "
                  "(use the im:: indexes, or wrap it in MarkShallow if copies are cheap)");

    Grouped(KeyFn key_fn, MakeFn make)
        : key_fn_(std::move(key_fn)), make_(std::move(make)), empty_(std::invoke(make_)) {}

    template <class In>
    void insert(Seal seal, const Insert<In>& op) {
        insert_into(group_of(op.new_value), seal, op);
    }

    template <class In>
    void update(Seal seal, const Update<In>& op) {
        GroupKey next = group_of(op.new_value);
        GroupKey prev = group_of(op.existing);
        if (next == prev) {
            const bool found = groups_.modify(prev, [&](group_type& g) {
                g.update(seal, op);
                return true;
            });
            TESSERA_ENSURE(found, "grouped", "update of key " << op.key.id << " hit a missing group");
            return;
        }
        remove_from(prev, seal, Remove<In>{op.key, op.existing});
        insert_into(std::move(next), seal, Insert<In>{op.key, op.new_value});
    }

    template <class In>
    void remove(Seal seal, const Remove<In>& op) {
        remove_from(group_of(op.existing), seal, op);
    }

    /** \brief The inner index of a group; an empty inner index when the group does not exist. */
    [[nodiscard]] auto get(const GroupKey& group) const -> const inner_type& {
        const group_type* g = groups_.find(group);
        return g ? g->_1() : empty_;
    }

    [[nodiscard]] auto contains_group(const GroupKey& group) const -> bool {
        return groups_.find(group) != nullptr;
    }

    /** \brief Number of live records in a group. */
    [[nodiscard]] auto group_size(const GroupKey& group) const -> std::size_t {
        const group_type* g = groups_.find(group);
        return g ? g->_2().get() : 0;
    }

    /** \brief Number of non-empty groups. */
    [[nodiscard]] auto group_count() const -> std::size_t { return groups_.size(); }

    /** \brief Visit every group as f(const GroupKey&, const inner_type&). */
    template <class F>
    void for_each_group(F&& f) const {
        groups_.for_each([&](const GroupKey& k, const group_type& g) { std::invoke(f, k, g._1()); });
    }

    [[nodiscard]] auto group_keys() const -> std::vector<GroupKey> {
        std::vector<GroupKey> out;
        out.reserve(groups_.size());
        groups_.for_each([&](const GroupKey& k, const group_type&) { out.push_back(k); });
        return out;
    }

private:
    template <class V>
    auto group_of(const V& value) -> GroupKey {
        return GroupKey(std::invoke(key_fn_, value));
    }

    template <class In>
    void insert_into(GroupKey group, Seal seal, const Insert<In>& op) {
        groups_.upsert(group, [&] { return group_type(std::invoke(make_), aggregation::Count<std::size_t>{}); },
                       [&](group_type& g) { g.insert(seal, op); });
    }

    template <class In>
    void remove_from(const GroupKey& group, Seal seal, const Remove<In>& op) {
        const bool found = groups_.modify(group, [&](group_type& g) {
            g.remove(seal, op);
            return g._2().get() > 0;
        });
        TESSERA_ENSURE(found, "grouped", "remove of key " << op.key.id << " hit a missing group");
    }

    KeyFn key_fn_;
    MakeFn make_;
    inner_type empty_;
    map_type groups_;
};

/** \brief Build a Grouped index; GroupKey is given explicitly, e.g. grouped<std::string>(...). */
template <class GroupKey, class Backing = backing::std_hash, class KeyFn, class MakeFn>
[[nodiscard]] auto grouped(KeyFn key_fn, MakeFn make) -> Grouped<GroupKey, KeyFn, MakeFn, Backing> {
    return Grouped<GroupKey, KeyFn, MakeFn, Backing>(std::move(key_fn), std::move(make));
}

} // namespace tessera::index
