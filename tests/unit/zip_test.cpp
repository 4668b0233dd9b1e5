#include <catch2/catch_all.hpp>
#include <tessera/aggregation/count.hpp>
#include <tessera/collection.hpp>
#include <tessera/index/forward.hpp>
#include <tessera/index/hashtable.hpp>
#include <tessera/index/keys.hpp>
#include <tessera/index/zip.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace tessera;

namespace {

// Appends its tag to a shared log on every call.
class tagged_index {
public:
  tagged_index(std::string tag, std::shared_ptr<std::vector<std::string>> log)
      : tag_(std::move(tag)), log_(std::move(log)) {}

  template <class In>
  void insert(Seal, const Insert<In>&) { log_->push_back(tag_ + ":insert"); }
  template <class In>
  void update(Seal, const Update<In>&) { log_->push_back(tag_ + ":update"); }
  template <class In>
  void remove(Seal, const Remove<In>&) { log_->push_back(tag_ + ":remove"); }

private:
  std::string tag_;
  std::shared_ptr<std::vector<std::string>> log_;
};

struct InventoryIndex {
  index::HashTable<int> by_value;
  index::Keys<> keys;
  aggregation::Count<> count;

  template <class Op>
  void insert(Seal s, const Op& op) { index::forward_each(s, op, by_value, keys, count); }
  template <class Op>
  void update(Seal s, const Op& op) { index::forward_each(s, op, by_value, keys, count); }
  template <class Op>
  void remove(Seal s, const Op& op) { index::forward_each(s, op, by_value, keys, count); }
};

} // namespace

TEST_CASE("zip forwards to members in declaration order", "[zip]") {
  auto log = std::make_shared<std::vector<std::string>>();
  Collection<int, index::Zip<tagged_index, tagged_index, tagged_index>> db(
      index::zip(tagged_index("a", log), tagged_index("b", log), tagged_index("c", log)));

  const Key k = db.insert(1);
  db.adjust_by_key(k, [](const int& v) { return v + 1; });
  db.delete_by_key(k);

  REQUIRE(*log == std::vector<std::string>{"a:insert", "b:insert", "c:insert", "a:update", "b:update",
                                           "c:update", "a:remove", "b:remove", "c:remove"});
}

TEST_CASE("zip members are reachable by position", "[zip]") {
  Collection<int, index::Zip<index::HashTable<int>, aggregation::Count<>>> db;
  const Key k = db.insert(4);
  db.insert(4);
  REQUIRE(db.index()._2().get() == 2);
  REQUIRE(db.index().get<1>().get() == 2);
  REQUIRE(db.index()._1().count(4) == 2);
  REQUIRE(db.index().get<0>().get_all(4).size() == 2);
  db.delete_by_key(k);
  REQUIRE(db.index()._2().get() == 1);
}

TEST_CASE("a struct of indexes wired with forward_each", "[zip]") {
  Collection<int, InventoryIndex> db;
  const Key a = db.insert(10);
  db.insert(20);
  db.adjust_by_key(a, [](const int&) { return 20; });

  REQUIRE(db.index().count.get() == 2);
  REQUIRE(db.index().keys.count() == 2);
  REQUIRE(db.index().by_value.count(20) == 2);
  REQUIRE_FALSE(db.index().by_value.contains(10));

  auto both = db.query([](const InventoryIndex& ix) { return ix.by_value.get_all(20); });
  REQUIRE(both.size() == 2);
}
