#pragma once

/** \file collection.hpp
 *  \brief Record store plus one (possibly composite) index kept in sync.
 *
 * Ordering contract for every mutation:
 * - insert: the store holds the new value before the index sees Insert.
 * - update/remove: the index sees Update/Remove while the old value is still
 *   in the store; the store is overwritten or evicted afterwards.
 *
 * Queries run a caller-supplied function against the index only; the Keys it
 * returns are then resolved against the store (see query_result.hpp). A Key
 * reported by the index but missing from the store is an invariant violation.
 *
 * Example usage:
 * ```cpp
 * struct Session { std::string user; std::int64_t expires; };
 *
 * auto ix = index::zip(
 *     index::premap([](const Session& s) -> const std::string& { return s.user; },
 *                   index::HashTable<std::string>{}),
 *     index::premap([](const Session& s) { return s.expires; },
 *                   index::BTree<std::int64_t>{}));
 * Collection<Session, decltype(ix)> db(std::move(ix));
 *
 * db.insert(Session{"ada", 100});
 * auto live = db.query([](const auto& ix) { return ix._2()->range_from(50); });
 * db.delete_where([](const auto& ix) { return ix._2()->range_to(50); });
 * ```
 *
 * Thread-safety: none. Callers serialize access externally.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "tessera/core/diagnostics.hpp"
#include "tessera/core/key.hpp"
#include "tessera/core/ops.hpp"
#include "tessera/core/options.hpp"
#include "tessera/core/seal.hpp"
#include "tessera/core/shallow_clone.hpp"
#include "tessera/core/store.hpp"
#include "tessera/error.hpp"
#include "tessera/query_result.hpp"

namespace tessera {

template <class In, class Ix, class Store = hash_store<In>>
class Collection {
public:
    using value_type = In;
    using index_type = Ix;
    using store_type = Store;

    static constexpr bool shallow_clonable = is_shallow_clone_v<Ix> && is_shallow_clone_v<Store>;

    explicit Collection(Ix index = Ix{}, CollectionOptions options = {})
        : Collection(Store{}, std::move(index), options) {}

    Collection(Store store, Ix index, CollectionOptions options = {})
        : store_(std::move(store)), index_(std::move(index)), options_(options) {
        if (options_.reserve > 0) store_.reserve(options_.reserve);
    }

    /** \brief Read access to the index, for inspection outside query(). */
    [[nodiscard]] auto index() const noexcept -> const Ix& { return index_; }
    [[nodiscard]] auto options() const noexcept -> const CollectionOptions& { return options_; }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return store_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return store_.empty(); }

    [[nodiscard]] auto get_by_key(Key key) const -> const In* { return store_.find(key); }
    [[nodiscard]] auto contains(Key key) const -> bool { return store_.find(key) != nullptr; }

    [[nodiscard]] auto try_get(Key key) const
        -> std::expected<std::reference_wrapper<const In>, core::error> {
        const In* v = store_.find(key);
        if (v == nullptr) {
            return std::unexpected(core::error{core::error_code::not_found,
                                               "no record for key " + std::to_string(key.id),
                                               "collection.try_get"});
        }
        return std::cref(*v);
    }

    /** \brief Visit every record as f(Key, const In&). Order depends on Store. */
    template <class F>
    void for_each(F&& f) const {
        store_.for_each(std::forward<F>(f));
    }

    /** \brief Store a new record and return its freshly allocated key. */
    auto insert(In value) -> Key {
        const Key key = next_key();
        const In& stored = store_.insert_or_assign(key, std::move(value));
        index_.insert(Seal{}, Insert<In>{key, stored});
        trace_op("insert", key);
        return key;
    }

    template <class Range>
    void insert_all(Range&& values) {
        for (auto&& v : values) insert(In(std::forward<decltype(v)>(v)));
    }

    /** \brief Replace (or create) the record at key with f(current).
     *
     * f receives nullptr when no record exists. Creating a record at a key
     * that was never allocated advances the key counter past it.
     */
    template <class F>
    void update_by_key(Key key, F&& f) {
        const In* existing = store_.find(key);
        if (existing != nullptr) {
            In next = std::invoke(f, existing);
            index_.update(Seal{}, Update<In>{key, next, *existing});
            store_.insert_or_assign(key, std::move(next));
            trace_op("update", key);
            return;
        }
        In next = std::invoke(f, static_cast<const In*>(nullptr));
        reserve_key(key);
        const In& stored = store_.insert_or_assign(key, std::move(next));
        index_.insert(Seal{}, Insert<In>{key, stored});
        trace_op("insert", key);
    }

    /** \brief Mutate, create or delete the record at key through an optional.
     *
     * The index sees Remove for the old value (if any) and Insert for the
     * value left in the optional (if any).
     */
    template <class F>
    void update_by_key_mut(Key key, F&& f) {
        std::optional<In> slot = delete_by_key(key);
        std::invoke(f, slot);
        if (!slot) return;
        reserve_key(key);
        const In& stored = store_.insert_or_assign(key, std::move(*slot));
        index_.insert(Seal{}, Insert<In>{key, stored});
        trace_op("insert", key);
    }

    /** \brief Replace an existing record with f(current); no-op when absent. */
    template <class F>
    void adjust_by_key(Key key, F&& f) {
        const In* existing = store_.find(key);
        if (existing == nullptr) return;
        In next = std::invoke(f, *existing);
        index_.update(Seal{}, Update<In>{key, next, *existing});
        store_.insert_or_assign(key, std::move(next));
        trace_op("update", key);
    }

    /** \brief Mutate an existing record in place; no-op when absent.
     *
     * The index sees Remove before f runs and Insert after.
     */
    template <class F>
    void adjust_by_key_mut(Key key, F&& f) {
        const In* existing = store_.find(key);
        if (existing == nullptr) return;
        index_.remove(Seal{}, Remove<In>{key, *existing});
        store_.modify(key, std::forward<F>(f));
        const In* stored = store_.find(key);
        TESSERA_ENSURE(stored != nullptr, "collection", "record vanished during adjust, key=" << key.id);
        index_.insert(Seal{}, Insert<In>{key, *stored});
        trace_op("update", key);
    }

    /** \brief Delete and return the record at key; std::nullopt when absent. */
    auto delete_by_key(Key key) -> std::optional<In> {
        const In* existing = store_.find(key);
        if (existing == nullptr) return std::nullopt;
        index_.remove(Seal{}, Remove<In>{key, *existing});
        auto out = store_.extract(key);
        trace_op("delete", key);
        return out;
    }

    /** \brief Run f against the index and resolve its keys to `const In*`. */
    template <class F>
    [[nodiscard]] auto query(F&& f) const {
        using R = query_type<F>;
        auto resolve = [this](Key k) -> const In* { return &get_unwrapped(k); };
        return query_result<R>::map(std::invoke(f, index_), resolve);
    }

    /** \brief Run f against the index without touching the store. */
    template <class F>
    [[nodiscard]] auto query_keys(F&& f) const {
        using R = query_type<F>;
        auto identity = [](Key k) -> Key { return k; };
        return query_result<R>::map(std::invoke(f, index_), identity);
    }

    /** \brief Like query(), but each key resolves to (Key, const In*). */
    template <class F>
    [[nodiscard]] auto query_with_keys(F&& f) const {
        using R = query_type<F>;
        auto resolve = [this](Key k) -> std::pair<Key, const In*> {
            return {k, &get_unwrapped(k)};
        };
        return query_result<R>::map(std::invoke(f, index_), resolve);
    }

    /** \brief Delete every record selected by f. Returns the number deleted. */
    template <class F>
    auto delete_where(F&& f) -> std::size_t {
        std::size_t affected = 0;
        for (Key k : collect_distinct_keys(std::forward<F>(f))) {
            if (delete_by_key(k)) ++affected;
        }
        return affected;
    }

    /** \brief Replace every record selected by f with g(record). Returns the number updated. */
    template <class F, class G>
    auto update_where(F&& f, G&& g) -> std::size_t {
        std::size_t affected = 0;
        for (Key k : collect_distinct_keys(std::forward<F>(f))) {
            const In* existing = store_.find(k);
            TESSERA_ENSURE(existing != nullptr, "collection", "update_where: key " << k.id << " not in store");
            In next = std::invoke(g, *existing);
            index_.update(Seal{}, Update<In>{k, next, *existing});
            store_.insert_or_assign(k, std::move(next));
            trace_op("update", k);
            ++affected;
        }
        return affected;
    }

    /** \brief Delete every record selected by f and return them in the shape of f's answer. */
    template <class F>
    auto take(F&& f) {
        using R = query_type<F>;
        static_assert(is_distinct_result_v<R>, "take requires a result with distinct keys");
        auto evict = [this](Key k) -> In {
            auto v = delete_by_key(k);
            TESSERA_ENSURE(v.has_value(), "collection", "take: key " << k.id << " not in store");
            return std::move(*v);
        };
        return query_result<R>::map(std::invoke(f, index_), evict);
    }

    /** \brief O(1) copy sharing all structure with this collection. */
    [[nodiscard]] auto shallow_clone() const -> Collection {
        static_assert(shallow_clonable,
                      "shallow_clone requires a persistent store and shallow-clonable indexes");
        return *this;
    }

private:
    template <class F>
    using query_type = std::remove_cvref_t<std::invoke_result_t<F&, const Ix&>>;

    template <class F>
    auto collect_distinct_keys(F&& f) const -> std::vector<Key> {
        using R = query_type<F>;
        static_assert(is_distinct_result_v<R>,
                      "bulk mutation requires a result with distinct keys (UniqueKeys, Key, "
                      "std::optional<Key> or UnsafeDistinct)");
        std::vector<Key> keys;
        auto collect = [&keys](Key k) -> Key {
            keys.push_back(k);
            return k;
        };
        (void)query_result<R>::map(std::invoke(f, index_), collect);
        return keys;
    }

    auto get_unwrapped(Key k) const -> const In& {
        const In* v = store_.find(k);
        TESSERA_ENSURE(v != nullptr, "collection", "index returned key " << k.id << " that is not in the store");
        return *v;
    }

    // The largest id is never handed out, so the counter cannot wrap.
    auto next_key() -> Key {
        TESSERA_ENSURE(next_key_id_ != max_key_id, "collection", "key space exhausted");
        return Key::unsafe_from_u64(next_key_id_++);
    }

    void reserve_key(Key key) {
        TESSERA_ENSURE(key.id != max_key_id, "collection", "key " << key.id << " is reserved");
        if (key.id >= next_key_id_) next_key_id_ = key.id + 1;
    }

    void trace_op(const char* op, Key key) const {
        if (!options_.trace && !options_.debug) return;
        std::ostringstream oss;
        oss << op << " key=" << key.id;
        if (options_.debug) oss << " size=" << store_.size();
        core::trace("collection", oss.str());
    }

    static constexpr std::uint64_t max_key_id = std::numeric_limits<std::uint64_t>::max();

    Store store_;
    Ix index_;
    CollectionOptions options_;
    std::uint64_t next_key_id_{0};
};

} // namespace tessera
