#include "kcoll_heap.hpp"
#include <algorithm>
#include <cstdio>
#include <functional>
#include <random>
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

void test_scenario() {
    std::printf("offer 5,1,10 -> poll 1,5,10...\n");
    kcoll::priority_queue<int> pq;
    CHECK(pq.peek() == nullptr);
    CHECK(!pq.poll());
    pq.offer(5);
    pq.offer(1);
    pq.offer(10);
    CHECK(*pq.peek() == 1);
    CHECK(pq.size() == 3);
    CHECK(*pq.poll() == 1);
    CHECK(*pq.poll() == 5);
    CHECK(*pq.poll() == 10);
    CHECK(pq.empty());
}

void test_random_interleave() {
    std::printf("random offer/poll vs sorted reference...\n");
    kcoll::priority_queue<int> pq;
    std::vector<int> ref;
    std::mt19937 rng(7);
    for (int i = 0; i < 20000; ++i) {
        if (rng() % 3 != 0 || ref.empty()) {
            int v = static_cast<int>(rng() % 1000);
            pq.offer(v);
            ref.push_back(v);
        } else {
            auto mn = std::min_element(ref.begin(), ref.end());
            auto got = pq.poll();
            if (!got || *got != *mn) {
                std::printf("  MISMATCH at op %d\n", i);
                ++fails;
                return;
            }
            ref.erase(mn);
        }
    }
    CHECK(pq.size() == ref.size());
    CHECK(pq.is_heap());
}

void test_comparator() {
    std::printf("max-heap via std::greater...\n");
    kcoll::priority_queue<std::string, std::greater<std::string>> pq{"pear", "apple", "zucchini", "fig"};
    CHECK(pq.is_heap());
    CHECK(*pq.poll() == "zucchini");
    CHECK(*pq.poll() == "pear");
    CHECK(*pq.poll() == "fig");
    CHECK(*pq.poll() == "apple");
}

void test_heapify_and_remove() {
    std::printf("range heapify / remove / contains...\n");
    std::vector<int> src;
    for (int i = 100; i > 0; --i) src.push_back(i);
    kcoll::priority_queue<int> pq(src.begin(), src.end());
    CHECK(pq.size() == 100);
    CHECK(pq.is_heap());
    CHECK(*pq.peek() == 1);

    CHECK(pq.contains(50));
    CHECK(pq.remove(50));
    CHECK(!pq.contains(50));
    CHECK(!pq.remove(500));
    CHECK(pq.remove(1));
    CHECK(pq.is_heap());
    CHECK(*pq.peek() == 2);

    int prev = 0;
    size_t n = 0;
    while (auto v = pq.poll()) {
        CHECK(*v > prev);
        prev = *v;
        ++n;
    }
    CHECK(n == 98);

    int sum = 0;
    kcoll::priority_queue<int> small{3, 1, 2};
    for (int v : small) sum += v;
    CHECK(sum == 6);
    small.clear();
    CHECK(small.empty());
}

void test_bounded_and_fail_fast() {
    std::printf("bounded / fail-fast...\n");
    kcoll::priority_queue<int> pq(std::less<int>(), 2);
    pq.offer(1);
    pq.offer(2);
    CHECK_FAULT(pq.offer(3), fault_kind::capacity_overflow);
    CHECK(pq.size() == 2);
    CHECK(pq.max_size() == 2);

    auto it = pq.begin();
    pq.poll();
    CHECK_FAULT(*it, fault_kind::concurrent_modification);
}

int main() {
    test_scenario();
    test_random_interleave();
    test_comparator();
    test_heapify_and_remove();
    test_bounded_and_fail_fast();

    std::printf("\npriority_queue tests: %s (%d fails)\n", fails ? "FAIL" : "PASS", fails);
    return fails ? 1 : 0;
}
