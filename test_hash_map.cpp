#include "kcoll_hash_map.hpp"
#include <cstdio>
#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>

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

// Every key collides; exercises chain append and removal mid-chain.
struct constant_hash {
    size_t operator()(int) const noexcept { return 7; }
};

void test_scenario() {
    std::printf("put a,b,a...\n");
    kcoll::hash_map<std::string, int> m;
    CHECK(!m.put("a", 1));
    CHECK(!m.put("b", 2));
    auto old = m.put("a", 3);
    CHECK(old && *old == 1);
    CHECK(m.size() == 2);
    CHECK(m.get("a") && *m.get("a") == 3);
    CHECK(*m.get("b") == 2);
    CHECK(m.get("c") == nullptr);
}

void test_lookup_surface() {
    std::printf("lookup surface...\n");
    kcoll::hash_map<std::string, int> m{{"x", 1}, {"y", 2}};
    CHECK(m.at("x") == 1);
    CHECK_FAULT(m.at("z"), fault_kind::not_found);
    CHECK(m.get_or("z", 42) == 42);
    CHECK(m.get_or("y", 42) == 2);
    CHECK(m.contains_key("y"));
    CHECK(!m.contains_key("z"));
    CHECK(m.contains_value(2));
    CHECK(!m.contains_value(3));

    CHECK(!m.put_if_absent("x", 9));
    CHECK(m.at("x") == 1);
    CHECK(m.put_if_absent("w", 9));
    CHECK(m.at("w") == 9);

    CHECK(m.insert_unique("v", 5) == 5);
    CHECK_FAULT(m.insert_unique("v", 6), fault_kind::duplicate_key);
    CHECK(m.at("v") == 5);

    int calls = 0;
    auto make = [&](const std::string& k) { ++calls; return static_cast<int>(k.size()) * 100; };
    CHECK(m.compute_if_absent("long", make) == 400);
    CHECK(m.compute_if_absent("long", make) == 400);
    CHECK(calls == 1);

    auto removed = m.remove("x");
    CHECK(removed && *removed == 1);
    CHECK(!m.remove("x"));
    CHECK(m.size() == 4);
}

void test_size_tracks_distinct_keys() {
    std::printf("random put/remove vs std::unordered_map...\n");
    kcoll::hash_map<uint32_t, uint32_t> m;
    std::unordered_map<uint32_t, uint32_t> ref;
    std::mt19937 rng(99);
    for (int i = 0; i < 50000; ++i) {
        uint32_t k = rng() % 5000;
        if (rng() % 3) {
            m.put(k, i);
            ref[k] = i;
        } else {
            bool had = ref.erase(k) != 0;
            CHECK(m.remove(k).has_value() == had);
        }
        if (m.size() != ref.size()) {
            std::printf("  SIZE MISMATCH at op %d: %zu vs %zu\n", i, m.size(), ref.size());
            ++fails;
            return;
        }
    }
    for (const auto& [k, v] : ref) {
        const uint32_t* got = m.get(k);
        if (!got || *got != v) { std::printf("  VALUE MISMATCH key %u\n", k); ++fails; return; }
    }
    size_t walked = 0;
    for (const auto& kv : m) { CHECK(ref.count(kv.first) == 1); ++walked; }
    CHECK(walked == ref.size());
    CHECK(m.load_factor() <= m.max_load_factor());
}

void test_resize_policy() {
    std::printf("lazy buckets / doubling / reserve...\n");
    kcoll::hash_map<int, int> m(kcoll::hash_options{4, 0.5f, true});
    CHECK(m.bucket_count() == 4);
    m.put(1, 1);
    CHECK(m.bucket_count() == 4);
    m.put(2, 2);                 // size 2 reaches 4 * 0.5
    CHECK(m.bucket_count() == 8);
    for (int i = 3; i <= 20; ++i) m.put(i, i);
    CHECK(m.bucket_count() == 64);
    for (int i = 1; i <= 20; ++i) CHECK(m.at(i) == i);

    kcoll::hash_map<int, int> r;
    r.reserve(1000);
    CHECK(r.bucket_count() >= 1000 / 0.75f);
    size_t before = r.bucket_count();
    for (int i = 0; i < 1000; ++i) r.put(i, i);
    CHECK(r.bucket_count() == before);

    // Oversized reserve requests clamp instead of overflowing.
    const size_t max_buckets = size_t{1} << (sizeof(size_t) * 8 - 2);
    kcoll::hash_map<int, int> huge(kcoll::hash_options{16, 0.25f, true});
    huge.reserve(std::numeric_limits<size_t>::max());
    CHECK(huge.bucket_count() == max_buckets);
    huge.reserve(max_buckets / 2);
    CHECK(huge.bucket_count() == max_buckets);
    CHECK(huge.empty());

    CHECK_FAULT((kcoll::hash_map<int, int>(kcoll::hash_options{16, 0.0f, true})), fault_kind::illegal_argument);
    CHECK_FAULT((kcoll::hash_map<int, int>(kcoll::hash_options{16, -1.0f, true})), fault_kind::illegal_argument);
}

void test_collisions() {
    std::printf("single-chain table...\n");
    kcoll::hash_map<int, int, constant_hash> m;
    for (int i = 0; i < 100; ++i) m.put(i, i * i);
    CHECK(m.size() == 100);
    for (int i = 0; i < 100; i += 3) CHECK(m.remove(i).has_value());
    for (int i = 0; i < 100; ++i) {
        if (i % 3 == 0) CHECK(m.get(i) == nullptr);
        else CHECK(m.get(i) && *m.get(i) == i * i);
    }
}

void test_absent_keys() {
    std::printf("absent-key policy...\n");
    kcoll::hash_map<std::optional<int>, int> allowed;
    allowed.put(std::nullopt, 1);
    allowed.put(std::nullopt, 2);
    allowed.put(5, 3);
    CHECK(allowed.size() == 2);
    CHECK(allowed.at(std::nullopt) == 2);

    kcoll::hash_options strict;
    strict.allow_absent_key = false;
    kcoll::hash_map<std::shared_ptr<int>, int> m(strict);
    auto p = std::make_shared<int>(1);
    m.put(p, 1);
    CHECK_FAULT(m.put(nullptr, 2), fault_kind::illegal_argument);
    CHECK(m.size() == 1);
    CHECK(m.get(nullptr) == nullptr);
}

void test_erase_and_fail_fast() {
    std::printf("iterator erase / fail-fast...\n");
    kcoll::hash_map<int, int> m;
    for (int i = 0; i < 50; ++i) m.put(i, i);
    for (auto it = m.begin(); it != m.end();) {
        if (it->first % 2) it = m.erase(it);
        else ++it;
    }
    CHECK(m.size() == 25);
    for (int i = 0; i < 50; ++i) CHECK(m.contains_key(i) == (i % 2 == 0));

    // Value replacement is not structural.
    auto it = m.begin();
    m.put(it->first, -1);
    CHECK(it->second == -1);

    auto it2 = m.begin();
    m.put(1000, 0);
    CHECK_FAULT(*it2, fault_kind::concurrent_modification);
    auto it3 = m.begin();
    m.remove(0);
    CHECK_FAULT(++it3, fault_kind::concurrent_modification);
    auto it4 = m.cbegin();
    m.clear();
    CHECK_FAULT(*it4, fault_kind::concurrent_modification);
    CHECK(m.empty());
}

void test_copy_move() {
    std::printf("copy / move / swap...\n");
    kcoll::hash_map<std::string, int> a{{"one", 1}, {"two", 2}};
    kcoll::hash_map<std::string, int> b(a);
    b.put("three", 3);
    CHECK(a.size() == 2 && b.size() == 3);
    kcoll::hash_map<std::string, int> c(std::move(b));
    CHECK(c.size() == 3 && b.empty());
    CHECK(c.at("three") == 3);
    swap(a, c);
    CHECK(a.size() == 3 && c.size() == 2);
    c = a;
    CHECK(c.size() == 3 && c.at("one") == 1);
}

void test_hash_set() {
    std::printf("hash_set...\n");
    kcoll::hash_set<std::string> s;
    CHECK(s.add("a"));
    CHECK(s.add("b"));
    CHECK(!s.add("a"));
    CHECK(s.size() == 2);
    CHECK(s.contains("a"));
    CHECK_FAULT(s.insert_unique("b"), fault_kind::duplicate_key);
    s.insert_unique("c");
    CHECK(s.remove("a"));
    CHECK(!s.remove("a"));

    std::unordered_set<std::string> seen;
    for (const auto& k : s) seen.insert(k);
    CHECK(seen.size() == 2 && seen.count("b") && seen.count("c"));

    for (auto it = s.begin(); it != s.end();) it = s.erase(it);
    CHECK(s.empty());
}

int main() {
    test_scenario();
    test_lookup_surface();
    test_size_tracks_distinct_keys();
    test_resize_policy();
    test_collisions();
    test_absent_keys();
    test_erase_and_fail_fast();
    test_copy_move();
    test_hash_set();

    std::printf("\nhash_map tests: %s (%d fails)\n", fails ? "FAIL" : "PASS", fails);
    return fails ? 1 : 0;
}
