#include "kcoll.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <map>
#include <unordered_map>
#include <vector>
#include <random>
#include <numeric>
#include <algorithm>
#include <string>

static double now_ms() {
    using clk = std::chrono::high_resolution_clock;
    static auto t0 = clk::now();
    return std::chrono::duration<double, std::milli>(clk::now() - t0).count();
}

template<typename T>
static void do_not_optimize(T const& val) {
    asm volatile("" : : "r,m"(val) : "memory");
}

static size_t rss_bytes() {
    FILE* f = std::fopen("/proc/self/statm", "r");
    if (!f) return 0;
    unsigned long pages = 0;
    if (std::fscanf(f, "%*lu %lu", &pages) != 1) pages = 0;
    std::fclose(f);
    return pages * 4096UL;
}

struct Result {
    const char* name;
    double insert_ms;
    double read_ms;
    double erase_ms;
    size_t memory_bytes;
};

static void print_header() {
    std::printf("%-22s %12s %12s %12s %12s %12s %12s %12s %12s\n",
                "Container", "Insert(ms)", "Read(ms)", "Erase(ms)", "Memory(KB)",
                "Ins rel", "Read rel", "Erase rel", "Mem rel");
    std::printf("%-22s %12s %12s %12s %12s %12s %12s %12s %12s\n",
                "----------------------", "----------", "----------", "----------",
                "----------", "----------", "----------", "----------", "----------");
}

static void print_row(const Result& r, const Result& base) {
    double ins_rel   = r.insert_ms / base.insert_ms;
    double read_rel  = r.read_ms   / base.read_ms;
    double erase_rel = base.erase_ms > 0 ? r.erase_ms / base.erase_ms : 0;
    double mem_rel   = base.memory_bytes ? static_cast<double>(r.memory_bytes) / base.memory_bytes : 0;
    std::printf("%-22s %12.2f %12.2f %12.2f %12.1f %11.2fx %11.2fx %11.2fx %11.2fx\n",
                r.name, r.insert_ms, r.read_ms, r.erase_ms,
                r.memory_bytes / 1024.0,
                ins_rel, read_rel, erase_rel, mem_rel);
}

using LookupRounds = std::vector<std::vector<uint64_t>>;

// MAP is default-constructed; INS/FIND/ERASE adapt its surface.
template<typename MAP, typename INS, typename FIND, typename ERASE>
static Result bench_map(const char* name, const std::vector<uint64_t>& keys,
                        const LookupRounds& rounds, INS ins, FIND find, ERASE erase) {
    Result res{name, 0, 0, 0, 0};
    size_t rss0 = rss_bytes();
    MAP m;

    double t0 = now_ms();
    for (auto k : keys) ins(m, k);
    res.insert_ms = now_ms() - t0;

    if (m.size() != keys.size())
        std::fprintf(stderr, "%s: size mismatch %zu vs %zu\n", name, m.size(), keys.size());

    size_t rss1 = rss_bytes();
    res.memory_bytes = (rss1 > rss0) ? (rss1 - rss0) : 0;

    uint64_t checksum = 0;
    double t1 = now_ms();
    for (auto& lk : rounds)
        for (auto k : lk) checksum += find(m, k);
    res.read_ms = (now_ms() - t1) / static_cast<int>(rounds.size());
    do_not_optimize(checksum);

    // Erase in shuffled order
    double t2 = now_ms();
    for (auto k : rounds[0]) erase(m, k);
    res.erase_ms = now_ms() - t2;
    if (!m.empty())
        std::fprintf(stderr, "%s: not empty after erase, %zu remaining\n", name, m.size());
    return res;
}

static Result bench_hash_map(const std::vector<uint64_t>& keys, const LookupRounds& rounds) {
    using M = kcoll::hash_map<uint64_t, uint64_t>;
    return bench_map<M>("kcoll::hash_map", keys, rounds,
        [](M& m, uint64_t k) { m.put(k, k); },
        [](M& m, uint64_t k) -> uint64_t { auto* v = m.get(k); return v ? *v : 0; },
        [](M& m, uint64_t k) { m.remove(k); });
}

static Result bench_linked_hash_map(const std::vector<uint64_t>& keys, const LookupRounds& rounds) {
    using M = kcoll::linked_hash_map<uint64_t, uint64_t>;
    return bench_map<M>("kcoll::linked_hash_map", keys, rounds,
        [](M& m, uint64_t k) { m.put(k, k); },
        [](M& m, uint64_t k) -> uint64_t { auto* v = m.get(k); return v ? *v : 0; },
        [](M& m, uint64_t k) { m.remove(k); });
}

static Result bench_tree_map(const std::vector<uint64_t>& keys, const LookupRounds& rounds) {
    using M = kcoll::tree_map<uint64_t, uint64_t>;
    return bench_map<M>("kcoll::tree_map", keys, rounds,
        [](M& m, uint64_t k) { m.put(k, k); },
        [](M& m, uint64_t k) -> uint64_t { auto* v = m.get(k); return v ? *v : 0; },
        [](M& m, uint64_t k) { m.remove(k); });
}

static Result bench_stdmap(const std::vector<uint64_t>& keys, const LookupRounds& rounds) {
    using M = std::map<uint64_t, uint64_t>;
    return bench_map<M>("std::map", keys, rounds,
        [](M& m, uint64_t k) { m.emplace(k, k); },
        [](M& m, uint64_t k) -> uint64_t { auto it = m.find(k); return it != m.end() ? it->second : 0; },
        [](M& m, uint64_t k) { m.erase(k); });
}

static Result bench_unorderedmap(const std::vector<uint64_t>& keys, const LookupRounds& rounds) {
    using M = std::unordered_map<uint64_t, uint64_t>;
    return bench_map<M>("std::unordered_map", keys, rounds,
        [](M& m, uint64_t k) { m.emplace(k, k); },
        [](M& m, uint64_t k) -> uint64_t { auto it = m.find(k); return it != m.end() ? it->second : 0; },
        [](M& m, uint64_t k) { m.erase(k); });
}

// Heap: offer every key, then drain.
static void bench_heap(const std::vector<uint64_t>& keys) {
    kcoll::priority_queue<uint64_t> pq;
    double t0 = now_ms();
    for (auto k : keys) pq.offer(k);
    double offer_ms = now_ms() - t0;

    uint64_t prev = 0, checksum = 0;
    bool ordered = true;
    double t1 = now_ms();
    while (auto v = pq.poll()) {
        if (*v < prev) ordered = false;
        prev = *v;
        checksum += *v;
    }
    double poll_ms = now_ms() - t1;
    do_not_optimize(checksum);
    std::printf("\npriority_queue: offer %.2f ms, poll %.2f ms%s\n",
                offer_ms, poll_ms, ordered ? "" : "  (ORDER BROKEN)");
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: %s <N> [pattern] [read_iters]\n", argv[0]);
        return 1;
    }

    size_t n = std::strtoull(argv[1], nullptr, 10);
    if (n == 0) return 1;

    std::string pattern = (argc >= 3) ? argv[2] : "random";
    int read_iters = 0;
    if (argc >= 4) read_iters = std::atoi(argv[3]);
    if (read_iters <= 0) {
        if      (n <= 1000)    read_iters = 5000;
        else if (n <= 10000)   read_iters = 500;
        else if (n <= 100000)  read_iters = 50;
        else if (n <= 1000000) read_iters = 5;
        else                   read_iters = 1;
    }

    std::vector<uint64_t> keys(n);
    std::mt19937_64 rng(42);

    if (pattern == "sequential") {
        std::iota(keys.begin(), keys.end(), 0ULL);
    } else if (pattern == "dense16") {
        for (size_t i = 0; i < n; ++i)
            keys[i] = 0x123400000000ULL + (rng() % (n * 2));
    } else {
        for (size_t i = 0; i < n; ++i) keys[i] = rng();
    }

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    n = keys.size();
    std::shuffle(keys.begin(), keys.end(), rng);

    LookupRounds rounds(read_iters);
    for (int i = 0; i < read_iters; ++i) {
        rounds[i] = keys;
        std::shuffle(rounds[i].begin(), rounds[i].end(), rng);
    }

    std::printf("=== kcoll benchmark ===\nN = %zu unique keys, pattern = %s, read_iters = %d\n\n",
                n, pattern.c_str(), read_iters);

    return kcoll::run_top_level([&] {
        Result r_hash   = bench_hash_map(keys, rounds);
        Result r_linked = bench_linked_hash_map(keys, rounds);
        Result r_tree   = bench_tree_map(keys, rounds);
        Result r_map    = bench_stdmap(keys, rounds);
        Result r_umap   = bench_unorderedmap(keys, rounds);

        print_header();
        print_row(r_hash,   r_hash);
        print_row(r_linked, r_hash);
        print_row(r_tree,   r_hash);
        print_row(r_map,    r_hash);
        print_row(r_umap,   r_hash);

        std::printf("\nBytes/entry:\n");
        for (const Result* r : {&r_hash, &r_linked, &r_tree, &r_map, &r_umap})
            std::printf("  %-22s %6.1f\n", r->name, double(r->memory_bytes) / n);

        bench_heap(keys);
    });
}
