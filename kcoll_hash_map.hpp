#ifndef KCOLL_HASH_MAP_HPP
#define KCOLL_HASH_MAP_HPP

#include "kcoll_hash_core.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcoll {

// ==========================================================================
// basic_hash_map  -- map surface over hash_core
//
// LINKED selects the ordered variant (see linked_hash_map). Lookup misses
// are reported as "no value" (null pointer / empty optional); at() is the
// faulting form.
// ==========================================================================

template<typename KEY, typename VALUE, typename HASH, typename EQUAL, typename ALLOC, bool LINKED>
class basic_hash_map {
public:
    using key_type       = KEY;
    using mapped_type    = VALUE;
    using value_type     = std::pair<const KEY, VALUE>;
    using size_type      = std::size_t;
    using hasher         = HASH;
    using key_equal      = EQUAL;
    using allocator_type = ALLOC;

protected:
    using core_type = hash_core<value_type, KEY, map_key_of, HASH, EQUAL, ALLOC, LINKED>;
    using node      = typename core_type::node;

    core_type core_;

public:
    using iterator       = typename core_type::iterator;
    using const_iterator = typename core_type::const_iterator;

    basic_hash_map() = default;

    explicit basic_hash_map(const hash_options& opts, const HASH& h = HASH(), const EQUAL& e = EQUAL(),
                            const ALLOC& a = ALLOC())
        : core_(opts, h, e, a) {}

    basic_hash_map(std::initializer_list<value_type> init) {
        for (const auto& kv : init) put(kv.first, kv.second);
    }

    [[nodiscard]] bool   empty() const noexcept { return core_.size() == 0; }
    [[nodiscard]] size_t size()  const noexcept { return core_.size(); }

    size_t bucket_count()    const noexcept { return core_.bucket_count(); }
    float  load_factor()     const noexcept { return core_.load_factor(); }
    float  max_load_factor() const noexcept { return core_.max_load_factor(); }
    void   reserve(size_t n) { core_.reserve(n); }

    // ==================================================================
    // Lookup
    // ==================================================================

    VALUE* get(const KEY& key) {
        node* n = core_.find(key);
        if (!n) return nullptr;
        core_.touch(n);
        return &n->value.second;
    }

    const VALUE* get(const KEY& key) const {
        node* n = core_.find(key);
        return n ? &n->value.second : nullptr;
    }

    VALUE& at(const KEY& key) {
        VALUE* v = get(key);
        if (!v) raise(fault_kind::not_found, "key not present in hash map");
        return *v;
    }

    const VALUE& at(const KEY& key) const {
        const VALUE* v = get(key);
        if (!v) raise(fault_kind::not_found, "key not present in hash map");
        return *v;
    }

    VALUE get_or(const KEY& key, VALUE fallback) {
        VALUE* v = get(key);
        return v ? *v : std::move(fallback);
    }

    bool contains_key(const KEY& key) const { return core_.find(key) != nullptr; }

    bool contains_value(const VALUE& value) const {
        for (node* n = core_.first_node(); n; n = core_.next_node(n))
            if (n->value.second == value) return true;
        return false;
    }

    // ==================================================================
    // Insert / replace
    // ==================================================================

    // Returns the previous value when key was present.
    std::optional<VALUE> put(const KEY& key, VALUE value) {
        auto [n, inserted] = core_.emplace_key(key, key, std::move(value));
        if (inserted) return std::nullopt;
        // value was not consumed on the replace path
        std::optional<VALUE> old(std::exchange(n->value.second, std::move(value)));
        core_.touch(n);
        return old;
    }

    bool put_if_absent(const KEY& key, VALUE value) {
        auto [n, inserted] = core_.emplace_key(key, key, std::move(value));
        if (!inserted) core_.touch(n);
        return inserted;
    }

    VALUE& insert_unique(const KEY& key, VALUE value) {
        auto [n, inserted] = core_.emplace_key(key, key, std::move(value));
        if (!inserted) raise(fault_kind::duplicate_key, "key already present in hash map");
        return n->value.second;
    }

    template<typename FN>
    VALUE& compute_if_absent(const KEY& key, FN&& make) {
        node* n = core_.find(key);
        if (n) {
            core_.touch(n);
            return n->value.second;
        }
        return core_.emplace_key(key, key, std::invoke(std::forward<FN>(make), key)).first->value.second;
    }

    // ==================================================================
    // Remove
    // ==================================================================

    std::optional<VALUE> remove(const KEY& key) {
        node* n = core_.detach_key(key);
        if (!n) return std::nullopt;
        std::optional<VALUE> out(std::move(n->value.second));
        core_.release(n);
        return out;
    }

    iterator erase(const_iterator pos) {
        core_type::verify(pos);
        node* next = core_.erase_node(core_type::node_of(pos));
        return core_.make_iterator(next);
    }

    void clear() noexcept { core_.clear(); }

    void swap(basic_hash_map& o) noexcept { core_.swap(o.core_); }

    // ==================================================================
    // Iteration
    // ==================================================================

    iterator       begin()        noexcept { return core_.begin(); }
    iterator       end()          noexcept { return core_.end(); }
    const_iterator begin()  const noexcept { return core_.begin(); }
    const_iterator end()    const noexcept { return core_.end(); }
    const_iterator cbegin() const noexcept { return core_.begin(); }
    const_iterator cend()   const noexcept { return core_.end(); }

    const HASH&  hash_function() const noexcept { return core_.hash_function(); }
    const EQUAL& key_eq()        const noexcept { return core_.key_eq(); }
};

// ==========================================================================
// basic_hash_set
// ==========================================================================

template<typename KEY, typename HASH, typename EQUAL, typename ALLOC, bool LINKED>
class basic_hash_set {
public:
    using key_type       = KEY;
    using value_type     = KEY;
    using size_type      = std::size_t;
    using hasher         = HASH;
    using key_equal      = EQUAL;
    using allocator_type = ALLOC;

protected:
    using core_type = hash_core<KEY, KEY, set_key_of, HASH, EQUAL, ALLOC, LINKED>;
    using node      = typename core_type::node;

    core_type core_;

public:
    // Elements are keys and may not be modified in place.
    using iterator       = typename core_type::const_iterator;
    using const_iterator = typename core_type::const_iterator;

    basic_hash_set() = default;

    explicit basic_hash_set(const hash_options& opts, const HASH& h = HASH(), const EQUAL& e = EQUAL(),
                            const ALLOC& a = ALLOC())
        : core_(opts, h, e, a) {}

    basic_hash_set(std::initializer_list<KEY> init) {
        for (const auto& k : init) add(k);
    }

    [[nodiscard]] bool   empty() const noexcept { return core_.size() == 0; }
    [[nodiscard]] size_t size()  const noexcept { return core_.size(); }

    size_t bucket_count() const noexcept { return core_.bucket_count(); }
    float  load_factor()  const noexcept { return core_.load_factor(); }
    void   reserve(size_t n) { core_.reserve(n); }

    // True when key was not already present.
    bool add(const KEY& key) { return core_.emplace_key(key, key).second; }

    void insert_unique(const KEY& key) {
        if (!add(key)) raise(fault_kind::duplicate_key, "key already present in hash set");
    }

    bool contains(const KEY& key) const { return core_.find(key) != nullptr; }

    bool remove(const KEY& key) {
        node* n = core_.detach_key(key);
        if (!n) return false;
        core_.release(n);
        return true;
    }

    iterator erase(const_iterator pos) {
        core_type::verify(pos);
        node* next = core_.erase_node(core_type::node_of(pos));
        return std::as_const(core_).make_iterator(next);
    }

    void clear() noexcept { core_.clear(); }

    void swap(basic_hash_set& o) noexcept { core_.swap(o.core_); }

    const_iterator begin()  const noexcept { return core_.begin(); }
    const_iterator end()    const noexcept { return core_.end(); }
    const_iterator cbegin() const noexcept { return core_.begin(); }
    const_iterator cend()   const noexcept { return core_.end(); }
};

// ==========================================================================
// Unordered variants
// ==========================================================================

template<typename KEY, typename VALUE, typename HASH = std::hash<KEY>, typename EQUAL = std::equal_to<KEY>,
         typename ALLOC = std::allocator<std::pair<const KEY, VALUE>>>
using hash_map = basic_hash_map<KEY, VALUE, HASH, EQUAL, ALLOC, false>;

template<typename KEY, typename HASH = std::hash<KEY>, typename EQUAL = std::equal_to<KEY>,
         typename ALLOC = std::allocator<KEY>>
using hash_set = basic_hash_set<KEY, HASH, EQUAL, ALLOC, false>;

// ==========================================================================
// linked_hash_map  -- hash map with a predictable iteration order
//
// order_mode::insertion: entries iterate in first-insertion order;
//   replacing a value does not move the entry.
// order_mode::access: every hit through get/at/get_or/put/put_if_absent/
//   compute_if_absent moves the entry to the tail. peek() reads without
//   moving. The head is then the least recently used entry; evicting it
//   (pop_first) is left to the caller.
// ==========================================================================

template<typename KEY, typename VALUE, typename HASH = std::hash<KEY>, typename EQUAL = std::equal_to<KEY>,
         typename ALLOC = std::allocator<std::pair<const KEY, VALUE>>>
class linked_hash_map : public basic_hash_map<KEY, VALUE, HASH, EQUAL, ALLOC, true> {
    using base = basic_hash_map<KEY, VALUE, HASH, EQUAL, ALLOC, true>;
    using typename base::node;
    using base::core_;

public:
    using typename base::value_type;

    linked_hash_map() = default;

    explicit linked_hash_map(order_mode mode, const hash_options& opts = {}, const HASH& h = HASH(),
                             const EQUAL& e = EQUAL(), const ALLOC& a = ALLOC())
        : base(opts, h, e, a) {
        core_.set_access_order(mode == order_mode::access);
    }

    linked_hash_map(std::initializer_list<value_type> init) : base(init) {}

    order_mode mode() const noexcept {
        return core_.access_order() ? order_mode::access : order_mode::insertion;
    }

    const VALUE* peek(const KEY& key) const {
        node* n = core_.find(key);
        return n ? &n->value.second : nullptr;
    }

    // Eldest and youngest entries in iteration order; null when empty.
    const value_type* first() const noexcept {
        node* n = core_.first_node();
        return n ? &n->value : nullptr;
    }

    const value_type* last() const noexcept {
        node* n = core_.last_node();
        return n ? &n->value : nullptr;
    }

    std::optional<std::pair<KEY, VALUE>> pop_first() {
        node* n = core_.first_node();
        if (!n) return std::nullopt;
        core_.detach(n);
        std::optional<std::pair<KEY, VALUE>> out(std::in_place, n->value.first, std::move(n->value.second));
        core_.release(n);
        return out;
    }
};

template<typename KEY, typename HASH = std::hash<KEY>, typename EQUAL = std::equal_to<KEY>,
         typename ALLOC = std::allocator<KEY>>
class linked_hash_set : public basic_hash_set<KEY, HASH, EQUAL, ALLOC, true> {
    using base = basic_hash_set<KEY, HASH, EQUAL, ALLOC, true>;
    using typename base::node;
    using base::core_;

public:
    linked_hash_set() = default;

    explicit linked_hash_set(const hash_options& opts, const HASH& h = HASH(), const EQUAL& e = EQUAL(),
                             const ALLOC& a = ALLOC())
        : base(opts, h, e, a) {}

    linked_hash_set(std::initializer_list<KEY> init) : base(init) {}

    const KEY* first() const noexcept {
        node* n = core_.first_node();
        return n ? &n->value : nullptr;
    }

    const KEY* last() const noexcept {
        node* n = core_.last_node();
        return n ? &n->value : nullptr;
    }

    std::optional<KEY> pop_first() {
        node* n = core_.first_node();
        if (!n) return std::nullopt;
        core_.detach(n);
        std::optional<KEY> out(std::move(n->value));
        core_.release(n);
        return out;
    }
};

template<typename K, typename V, typename H, typename E, typename A, bool L>
void swap(basic_hash_map<K, V, H, E, A, L>& l, basic_hash_map<K, V, H, E, A, L>& r) noexcept { l.swap(r); }

template<typename K, typename H, typename E, typename A, bool L>
void swap(basic_hash_set<K, H, E, A, L>& l, basic_hash_set<K, H, E, A, L>& r) noexcept { l.swap(r); }

} // namespace kcoll

#endif // KCOLL_HASH_MAP_HPP
