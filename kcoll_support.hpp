#ifndef KCOLL_SUPPORT_HPP
#define KCOLL_SUPPORT_HPP

#include "kcoll_fault.hpp"

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace kcoll {

// ==========================================================================
// Tunables (override with -D at build time)
// ==========================================================================

#ifndef KCOLL_DEFAULT_LOAD_FACTOR
#define KCOLL_DEFAULT_LOAD_FACTOR 0.75f
#endif

#ifndef KCOLL_DEFAULT_HASH_CAPACITY
#define KCOLL_DEFAULT_HASH_CAPACITY 16
#endif

#ifndef KCOLL_MIN_SEQ_CAPACITY
#define KCOLL_MIN_SEQ_CAPACITY 8
#endif

inline constexpr float  DEFAULT_LOAD_FACTOR   = KCOLL_DEFAULT_LOAD_FACTOR;
inline constexpr size_t DEFAULT_HASH_CAPACITY = KCOLL_DEFAULT_HASH_CAPACITY;
inline constexpr size_t MIN_SEQ_CAPACITY      = KCOLL_MIN_SEQ_CAPACITY;
inline constexpr size_t UNBOUNDED             = std::numeric_limits<size_t>::max();

static_assert(std::has_single_bit(DEFAULT_HASH_CAPACITY), "hash capacity must be a power of two");
static_assert(MIN_SEQ_CAPACITY > 0);

// Growth for contiguous storage: double, clamped to the element bound.
inline constexpr size_t grown_capacity(size_t cap, size_t bound) noexcept {
    size_t next = cap < MIN_SEQ_CAPACITY ? MIN_SEQ_CAPACITY
                : cap > UNBOUNDED / 2    ? UNBOUNDED
                                         : cap * 2;
    return next < bound ? next : bound;
}

inline void check_bound(size_t size, size_t bound, const char* container) {
    if (size >= bound) [[unlikely]]
        raise(fault_kind::capacity_overflow,
              std::string(container) + " is full (max_size " + std::to_string(bound) + ")");
}

// ==========================================================================
// Hash capability
//
// Caller hashes go through a finalizer before masking, so weak hashes such
// as the identity std::hash<int> still spread over a power-of-two table.
// Equal keys must hash equal; the table cannot detect a violation.
// ==========================================================================

inline constexpr size_t spread_hash(size_t h) noexcept {
    uint64_t x = static_cast<uint64_t>(h);
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    return static_cast<size_t>(x);
}

inline void check_load_factor(float lf) {
    if (!(lf > 0.0f) || !std::isfinite(lf)) [[unlikely]]
        raise(fault_kind::illegal_argument, "load factor must be positive and finite");
}

// ==========================================================================
// Absent keys
//
// Key types with a "no value" state. Whether such a key may be stored is a
// per-table option; when it is, it behaves as one ordinary key.
// ==========================================================================

template<typename KEY>
struct absent_key_traits {
    static constexpr bool has_absent = false;
    static constexpr bool is_absent(const KEY&) noexcept { return false; }
};

template<typename T>
struct absent_key_traits<T*> {
    static constexpr bool has_absent = true;
    static constexpr bool is_absent(T* const& k) noexcept { return k == nullptr; }
};

template<typename T>
struct absent_key_traits<std::optional<T>> {
    static constexpr bool has_absent = true;
    static constexpr bool is_absent(const std::optional<T>& k) noexcept { return !k.has_value(); }
};

template<typename T>
struct absent_key_traits<std::shared_ptr<T>> {
    static constexpr bool has_absent = true;
    static bool is_absent(const std::shared_ptr<T>& k) noexcept { return k == nullptr; }
};

template<typename KEY>
inline void check_absent_key(const KEY& key, bool allowed) {
    if constexpr (absent_key_traits<KEY>::has_absent) {
        if (!allowed && absent_key_traits<KEY>::is_absent(key)) [[unlikely]]
            raise(fault_kind::illegal_argument, "absent key not permitted by this table");
    }
}

// ==========================================================================
// Key extraction for node-based cores shared by maps and sets
// ==========================================================================

struct set_key_of {
    template<typename V>
    const V& operator()(const V& v) const noexcept { return v; }
};

struct map_key_of {
    template<typename P>
    const typename P::first_type& operator()(const P& p) const noexcept { return p.first; }
};

// ==========================================================================
// Ordering capability
//
// COMPARE must be a strict weak order consistent across calls. Two cheap
// probes run on every tree insert: irreflexivity of the inserted key and
// asymmetry against the node the search stopped at.
// ==========================================================================

template<typename COMPARE, typename KEY>
inline void check_irreflexive(const COMPARE& comp, const KEY& k) {
    if (comp(k, k)) [[unlikely]]
        raise(fault_kind::comparator_contract, "comparator reports a key less than itself");
}

template<typename COMPARE, typename KEY>
inline void check_asymmetric(const COMPARE& comp, const KEY& a, const KEY& b) {
    if (comp(a, b) && comp(b, a)) [[unlikely]]
        raise(fault_kind::comparator_contract, "comparator reports a < b and b < a");
}

// ==========================================================================
// Fail-fast iteration guard
//
// A container owns a generation and advances it on every structural
// mutation. Each iterator holds a generation_check taken at creation and
// verifies it before producing an element.
// ==========================================================================

class generation {
public:
    uint64_t current() const noexcept { return value_; }
    void advance() noexcept { ++value_; }

private:
    uint64_t value_ = 0;
};

class generation_check {
public:
    generation_check() noexcept = default;
    explicit generation_check(const generation& g) noexcept : gen_(&g), seen_(g.current()) {}

    void verify() const {
        if (gen_ && gen_->current() != seen_) [[unlikely]]
            raise(fault_kind::concurrent_modification,
                  "container structurally modified during iteration");
    }

private:
    const generation* gen_ = nullptr;
    uint64_t seen_ = 0;
};

} // namespace kcoll

#endif // KCOLL_SUPPORT_HPP
