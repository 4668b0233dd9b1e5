#include <catch2/catch_all.hpp>
#include <tessera/collection.hpp>
#include <tessera/index/hashtable.hpp>
#include <tessera/keyset.hpp>

#include <tests/support/reference_model.hpp>
#include <tests/support/seal_factory.hpp>

#include <set>
#include <string>

using namespace tessera;
using test_support::sorted;

TEST_CASE("hashtable groups keys by value", "[hashtable]") {
  Collection<std::string, index::HashTable<std::string>> db;
  const Key a1 = db.insert("a");
  const Key b = db.insert("b");
  const Key a2 = db.insert("a");

  auto q = [](const index::HashTable<std::string>& ix) { return ix.get_all("a"); };
  REQUIRE(sorted(db.query_keys(q)) == std::vector<Key>{a1, a2});
  REQUIRE(db.query([](const auto& ix) { return ix.count_distinct(); }) == 2u);
  REQUIRE(db.query([](const auto& ix) { return ix.count("a"); }) == 2u);
  REQUIRE(db.query_keys([](const auto& ix) { return ix.get_one("b"); }) == b);
  REQUIRE_FALSE(db.query([](const auto& ix) { return ix.contains("c"); }));
  REQUIRE(db.query([](const auto& ix) { return ix.all(); }).size() == 3);
}

TEST_CASE("hashtable drops a value once its last key leaves", "[hashtable]") {
  Collection<std::string, index::HashTable<std::string>> db;
  const Key k = db.insert("x");
  REQUIRE(db.index().contains("x"));
  db.adjust_by_key(k, [](const std::string&) { return std::string("y"); });
  REQUIRE_FALSE(db.index().contains("x"));
  REQUIRE(db.index().contains("y"));
  db.delete_by_key(k);
  REQUIRE(db.index().count_distinct() == 0);
  REQUIRE_FALSE(db.index().get_one("y").has_value());
}

TEST_CASE("hashtable driven directly with a seal", "[hashtable]") {
  index::HashTable<int, keyset::ordered_set> ix;
  const Seal seal = testing::seal_factory::make();
  const int v = 4;
  ix.insert(seal, Insert<int>{Key{2}, v});
  ix.insert(seal, Insert<int>{Key{1}, v});
  REQUIRE(ix.get_one(4) == Key{1});
  ix.remove(seal, Remove<int>{Key{1}, v});
  REQUIRE(ix.get_one(4) == Key{2});
}

TEST_CASE("hashtable matches a scan of the reference model", "[hashtable][property]") {
  using Ix = index::HashTable<int>;
  Collection<int, Ix> db;
  test_support::run_reference_ops(
      db, 7, 600, [](std::mt19937& rng) { return std::uniform_int_distribution<int>(0, 15)(rng); },
      [](const auto& db, const test_support::reference_map<int>& ref) {
        for (int lookup : {0, 3, 7, 15}) {
          auto got = sorted(db.query_keys([&](const Ix& ix) { return ix.get_all(lookup); }));
          REQUIRE(got == test_support::keys_where(ref, [&](int v) { return v == lookup; }));
        }
        std::set<int> distinct;
        for (const auto& [k, v] : ref) distinct.insert(v);
        REQUIRE(db.index().count_distinct() == distinct.size());
      });
}
