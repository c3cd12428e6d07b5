#include "kcoll_tree_map.hpp"
#include <cstdio>
#include <functional>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

int fails = 0;
void check(bool c, const char* msg, int line) {
    if (!c) { std::printf("  FAIL line %d: %s\n", line, msg); ++fails; }
}
#define CHECK(c) check((c), #c, __LINE__)
#define CHECK_FAULT(expr, k) do {                                      \
        bool hit_ = false;                                             \
        try { (void)(expr); }                                          \
        catch (const kcoll::fault& f_) { hit_ = f_.kind() == (k); }    \
        check(hit_, #expr " raises " #k, __LINE__);                    \
    } while (0)

using kcoll::fault_kind;

// Reports every pair as ordered both ways.
struct always_less {
    bool operator()(int, int) const noexcept { return true; }
};

// Irreflexive but not asymmetric for distinct keys.
struct not_asymmetric {
    bool operator()(int a, int b) const noexcept { return a != b; }
};

void test_set_scenario() {
    std::printf("add 5,1,10 / floor / ceiling...\n");
    kcoll::tree_set<int> s;
    s.add(5);
    s.add(1);
    s.add(10);
    std::vector<int> seen(s.begin(), s.end());
    CHECK((seen == std::vector<int>{1, 5, 10}));
    CHECK(*s.floor(6) == 5);
    CHECK(*s.ceiling(6) == 10);
    CHECK(*s.floor(5) == 5);
    CHECK(*s.ceiling(5) == 5);
    CHECK(*s.higher(5) == 10);
    CHECK(*s.lower(5) == 1);
    CHECK(s.floor(0) == nullptr);
    CHECK(s.ceiling(11) == nullptr);
    CHECK(s.higher(10) == nullptr);
    CHECK(s.lower(1) == nullptr);
    CHECK(*s.first() == 1 && *s.last() == 10);
    CHECK(s.validate());
}

void test_map_surface() {
    std::printf("map surface...\n");
    kcoll::tree_map<std::string, int> m;
    CHECK(m.first() == nullptr && m.last() == nullptr);
    CHECK(!m.put("m", 1));
    CHECK(!m.put("c", 2));
    CHECK(!m.put("x", 3));
    auto old = m.put("c", 20);
    CHECK(old && *old == 2);
    CHECK(m.size() == 3);
    CHECK(m.at("c") == 20);
    CHECK_FAULT(m.at("q"), fault_kind::not_found);
    CHECK(m.get_or("q", -1) == -1);
    CHECK(m.contains_key("x"));
    CHECK(!m.put_if_absent("x", 0));
    CHECK(m.put_if_absent("a", 0));
    CHECK_FAULT(m.insert_unique("a", 5), fault_kind::duplicate_key);
    CHECK(m.insert_unique("z", 26) == 26);

    CHECK(m.first()->first == "a");
    CHECK(m.last()->first == "z");
    CHECK(m.floor("n")->first == "m");
    CHECK(m.ceiling("n")->first == "x");

    auto r = m.remove("m");
    CHECK(r && *r == 1);
    CHECK(!m.remove("m"));

    auto lo = m.pop_first();
    CHECK(lo && lo->first == "a" && lo->second == 0);
    auto hi = m.pop_last();
    CHECK(hi && hi->first == "z" && hi->second == 26);
    CHECK(m.size() == 2);
    CHECK(m.validate());

    std::vector<std::string> rev;
    for (auto it = m.rbegin(); it != m.rend(); ++it) rev.push_back(it->first);
    CHECK((rev == std::vector<std::string>{"x", "c"}));
}

void test_random_vs_std_map() {
    std::printf("random put/remove vs std::map...\n");
    kcoll::tree_map<uint32_t, uint32_t> m;
    std::map<uint32_t, uint32_t> ref;
    std::mt19937 rng(2024);
    for (int i = 0; i < 40000; ++i) {
        uint32_t k = rng() % 4000;
        if (rng() % 3) {
            m.put(k, i);
            ref[k] = i;
        } else {
            bool had = ref.erase(k) != 0;
            CHECK(m.remove(k).has_value() == had);
        }
        if ((i & 1023) == 0 && !m.validate()) {
            std::printf("  INVALID TREE at op %d\n", i);
            ++fails;
            return;
        }
    }
    CHECK(m.validate());
    CHECK(m.size() == ref.size());

    // In-order walk is strictly increasing and matches the reference.
    auto rit = ref.begin();
    bool first = true;
    uint32_t prev = 0;
    for (const auto& kv : m) {
        if (!first && !(prev < kv.first)) { std::printf("  ORDER BROKEN\n"); ++fails; break; }
        if (rit == ref.end() || rit->first != kv.first || rit->second != kv.second) {
            std::printf("  MISMATCH at key %u\n", kv.first);
            ++fails;
            break;
        }
        prev = kv.first;
        first = false;
        ++rit;
    }
    CHECK(rit == ref.end());

    // Navigation agrees with std::map bounds.
    for (uint32_t q = 0; q < 4100; q += 37) {
        auto ce = ref.lower_bound(q);
        auto* got = m.ceiling(q);
        CHECK((ce == ref.end()) == (got == nullptr));
        if (got && ce != ref.end()) CHECK(got->first == ce->first);

        auto hi = ref.upper_bound(q);
        auto* h = m.higher(q);
        CHECK((hi == ref.end()) == (h == nullptr));
        if (h && hi != ref.end()) CHECK(h->first == hi->first);

        auto* fl = m.floor(q);
        if (hi == ref.begin()) CHECK(fl == nullptr);
        else CHECK(fl && fl->first == std::prev(hi)->first);

        auto* lw = m.lower(q);
        if (ce == ref.begin()) CHECK(lw == nullptr);
        else CHECK(lw && lw->first == std::prev(ce)->first);
    }
}

void test_sequential_shapes() {
    std::printf("ascending / descending inserts stay balanced...\n");
    kcoll::tree_set<int> up;
    kcoll::tree_set<int, std::greater<int>> down;
    for (int i = 0; i < 5000; ++i) {
        up.add(i);
        down.add(i);
    }
    CHECK(up.validate() && down.validate());
    CHECK(*down.first() == 4999);
    for (int i = 0; i < 5000; i += 2) up.remove(i);
    CHECK(up.validate());
    CHECK(up.size() == 2500);
    CHECK(*up.first() == 1);
    while (up.pop_last()) {}
    CHECK(up.empty() && up.validate());
}

void test_comparator_contract() {
    std::printf("comparator contract...\n");
    kcoll::tree_set<int, always_less> bad;
    CHECK_FAULT(bad.add(1), fault_kind::comparator_contract);
    CHECK(bad.empty());

    kcoll::tree_map<int, int, not_asymmetric> m;
    m.put(1, 1);                 // single node: nothing to compare against
    CHECK_FAULT(m.put(2, 2), fault_kind::comparator_contract);
    CHECK(m.size() == 1);
    CHECK(m.validate());
}

void test_iteration() {
    std::printf("bidirectional iteration / erase / fail-fast...\n");
    kcoll::tree_map<int, int> m;
    for (int i = 0; i < 20; ++i) m.put(i, i);

    auto it = m.end();
    --it;
    CHECK(it->first == 19);
    --it;
    CHECK(it->first == 18);
    ++it;
    ++it;
    CHECK(it == m.end());

    for (auto e = m.begin(); e != m.end();) {
        if (e->first % 3) e = m.erase(e);
        else ++e;
    }
    std::vector<int> left;
    for (const auto& kv : m) left.push_back(kv.first);
    CHECK((left == std::vector<int>{0, 3, 6, 9, 12, 15, 18}));
    CHECK(m.validate());

    auto live = m.begin();
    m.put(7, 7);
    CHECK_FAULT(*live, fault_kind::concurrent_modification);

    // Value replacement through put is not structural.
    auto live2 = m.begin();
    m.put(0, 100);
    CHECK(live2->second == 100);
    m.remove(3);
    CHECK_FAULT(++live2, fault_kind::concurrent_modification);

    kcoll::tree_set<int> s{3, 1, 2};
    auto sit = s.begin();
    s.pop_first();
    CHECK_FAULT(*sit, fault_kind::concurrent_modification);
}

void test_copy_move() {
    std::printf("copy / move / swap...\n");
    kcoll::tree_map<int, std::string> a{{2, "two"}, {1, "one"}, {3, "three"}};
    kcoll::tree_map<int, std::string> b(a);
    CHECK(b.validate() && b.size() == 3);
    b.put(4, "four");
    CHECK(a.size() == 3);
    kcoll::tree_map<int, std::string> c(std::move(b));
    CHECK(c.size() == 4 && b.empty());
    swap(a, c);
    CHECK(a.size() == 4 && c.size() == 3);
    c = a;
    CHECK(c.size() == 4 && c.at(4) == "four" && c.validate());
    c.clear();
    CHECK(c.empty() && c.validate());
    CHECK(a.size() == 4);
}

int main() {
    test_set_scenario();
    test_map_surface();
    test_random_vs_std_map();
    test_sequential_shapes();
    test_comparator_contract();
    test_iteration();
    test_copy_move();

    std::printf("\ntree_map tests: %s (%d fails)\n", fails ? "FAIL" : "PASS", fails);
    return fails ? 1 : 0;
}
