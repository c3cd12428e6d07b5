#include "kcoll_array_seq.hpp"
#include <cstdio>
#include <memory>
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

void test_basic() {
    std::printf("basic push/index...\n");
    kcoll::array_seq<int> s;
    CHECK(s.empty());
    CHECK(s.capacity() == 0);
    for (int i = 0; i < 100; ++i) s.push_back(i * 2);
    CHECK(s.size() == 100);
    CHECK(s.capacity() >= 100);
    CHECK(s[0] == 0 && s[99] == 198);
    CHECK(s.at(50) == 100);
    CHECK(s.front() == 0 && s.back() == 198);
    CHECK(s.index_of(42) == 21);
    CHECK(s.index_of(43) == kcoll::array_seq<int>::npos);
    CHECK(s.contains(198));
    CHECK(s.set(1, 7) == 2);
    CHECK(s[1] == 7);

    CHECK_FAULT(s.at(100), fault_kind::index_out_of_range);
    CHECK_FAULT(s.set(100, 1), fault_kind::index_out_of_range);
    CHECK_FAULT(s.erase_at(500), fault_kind::index_out_of_range);
    CHECK_FAULT(s.insert(101, 1), fault_kind::index_out_of_range);
}

void test_insert_erase() {
    std::printf("positional insert/erase...\n");
    kcoll::array_seq<std::string> s{"a", "c", "e"};
    s.insert(1, "b");
    s.insert(3, "d");
    s.insert(0, "_");
    s.insert(s.size(), "f");
    const char* want[] = {"_", "a", "b", "c", "d", "e", "f"};
    CHECK(s.size() == 7);
    for (size_t i = 0; i < s.size(); ++i) CHECK(s[i] == want[i]);

    CHECK(s.erase_at(0) == "_");
    CHECK(s.remove("d"));
    CHECK(!s.remove("zz"));
    CHECK(s.size() == 5);
    CHECK(s[0] == "a" && s[3] == "e" && s[4] == "f");
}

void test_stack_view() {
    std::printf("stack view...\n");
    kcoll::array_seq<int> s;
    CHECK(s.peek() == nullptr);
    s.push(1);
    s.push(2);
    s.push(3);
    CHECK(*s.peek() == 3);
    CHECK(s.pop() == 3);
    CHECK(s.pop() == 2);
    CHECK(s.pop_back() == 1);
    CHECK_FAULT(s.pop(), fault_kind::no_such_element);
    CHECK_FAULT(s.front(), fault_kind::no_such_element);
    CHECK_FAULT(s.back(), fault_kind::no_such_element);
}

void test_aliasing_append() {
    std::printf("append of own element across growth...\n");
    kcoll::array_seq<std::string> s;
    s.push_back(std::string(40, 'x'));
    for (int i = 0; i < 20; ++i) s.push_back(s[0]);
    CHECK(s.size() == 21);
    for (size_t i = 0; i < s.size(); ++i) CHECK(s[i].size() == 40);
}

void test_move_only() {
    std::printf("move-only elements...\n");
    kcoll::array_seq<std::unique_ptr<int>> s;
    for (int i = 0; i < 10; ++i) s.push_back(std::make_unique<int>(i));
    s.insert(5, std::make_unique<int>(99));
    CHECK(*s[5] == 99 && *s[6] == 5);
    auto p = s.erase_at(5);
    CHECK(*p == 99);
    CHECK(*s.pop_back() == 9);
    CHECK(s.size() == 9);
}

void test_capacity() {
    std::printf("reserve / shrink / bounded...\n");
    kcoll::array_seq<int> s;
    s.reserve(64);
    CHECK(s.capacity() == 64);
    s.push_back(1);
    s.shrink_to_fit();
    CHECK(s.capacity() == 1);
    s.clear();
    CHECK(s.empty());

    kcoll::array_seq<int> b(0, 3);
    b.push_back(1);
    b.push_back(2);
    b.push_back(3);
    CHECK(b.capacity() <= 3);
    CHECK_FAULT(b.push_back(4), fault_kind::capacity_overflow);
    CHECK_FAULT(b.insert(0, 4), fault_kind::capacity_overflow);
    CHECK(b.size() == 3);
    b.pop_back();
    b.push_back(9);
    CHECK(b.back() == 9);

    CHECK_FAULT(kcoll::array_seq<int>(4, 0), fault_kind::illegal_argument);
}

void test_copy_move() {
    std::printf("copy / move / swap...\n");
    kcoll::array_seq<int> a{1, 2, 3};
    kcoll::array_seq<int> b(a);
    b.push_back(4);
    CHECK(a.size() == 3 && b.size() == 4);
    kcoll::array_seq<int> c(std::move(b));
    CHECK(c.size() == 4 && b.empty());
    swap(a, c);
    CHECK(a.size() == 4 && c.size() == 3);
    c = a;
    CHECK(c.size() == 4 && c[3] == 4);
}

void test_iteration() {
    std::printf("iteration...\n");
    kcoll::array_seq<int> s;
    for (int i = 0; i < 10; ++i) s.push_back(i);
    int sum = 0;
    for (int v : s) sum += v;
    CHECK(sum == 45);

    // Iterator-driven removal of the odd elements.
    for (auto it = s.begin(); it != s.end();) {
        if (*it % 2) it = s.erase(it);
        else ++it;
    }
    CHECK(s.size() == 5);
    for (size_t i = 0; i < s.size(); ++i) CHECK(s[i] == static_cast<int>(i * 2));

    // set() is not structural
    auto it = s.begin();
    s.set(0, 100);
    CHECK(*it == 100);

    auto it2 = s.begin();
    s.push_back(11);
    CHECK_FAULT(*it2, fault_kind::concurrent_modification);
    CHECK_FAULT(++it2, fault_kind::concurrent_modification);
}

int main() {
    test_basic();
    test_insert_erase();
    test_stack_view();
    test_aliasing_append();
    test_move_only();
    test_capacity();
    test_copy_move();
    test_iteration();

    std::printf("\narray_seq tests: %s (%d fails)\n", fails ? "FAIL" : "PASS", fails);
    return fails ? 1 : 0;
}
