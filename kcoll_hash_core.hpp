#ifndef KCOLL_HASH_CORE_HPP
#define KCOLL_HASH_CORE_HPP

#include "kcoll_support.hpp"

#include <algorithm>
#include <bit>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace kcoll {

struct hash_options {
    size_t initial_capacity = DEFAULT_HASH_CAPACITY;
    float  load_factor      = DEFAULT_LOAD_FACTOR;
    bool   allow_absent_key = true;
};

enum class order_mode : uint8_t {
    insertion,
    access,
};

// ==========================================================================
// hash_node
//
// Chained node. The linked flavor also threads the node into the table's
// order list (before/after), so one unlink updates both structures.
// ==========================================================================

template<typename VALUE, bool LINKED>
struct hash_node;

template<typename VALUE>
struct hash_node<VALUE, false> {
    hash_node* next = nullptr;
    size_t     hash;
    VALUE      value;

    template<typename... ARGS>
    explicit hash_node(size_t h, ARGS&&... args) : hash(h), value(std::forward<ARGS>(args)...) {}
};

template<typename VALUE>
struct hash_node<VALUE, true> {
    hash_node* next   = nullptr;
    hash_node* before = nullptr;
    hash_node* after  = nullptr;
    size_t     hash;
    VALUE      value;

    template<typename... ARGS>
    explicit hash_node(size_t h, ARGS&&... args) : hash(h), value(std::forward<ARGS>(args)...) {}
};

// ==========================================================================
// hash_core  -- bucketed table shared by the hash maps and sets
//
// Layout: buckets_[bucket_count_] of chain heads, bucket_count_ a power of
// two (index = spread hash & mask). Buckets are allocated on first insert.
// When size / bucket_count reaches the load factor the table doubles and
// every node is relinked into the fresh array.
//
// LINKED adds a doubly linked order list over all nodes (insertion or access
// order); iteration then walks that list instead of the buckets.
//
// Keys must not change hash or equality while stored (undefined behavior).
// ==========================================================================

template<typename VALUE, typename KEY, typename KEYOF, typename HASH, typename EQUAL,
         typename ALLOC, bool LINKED>
class hash_core {
public:
    using node = hash_node<VALUE, LINKED>;

private:
    using node_alloc_type   = typename std::allocator_traits<ALLOC>::template rebind_alloc<node>;
    using bucket_alloc_type = typename std::allocator_traits<ALLOC>::template rebind_alloc<node*>;
    using NT = std::allocator_traits<node_alloc_type>;
    using BT = std::allocator_traits<bucket_alloc_type>;

    struct order_list {
        node* head = nullptr;
        node* tail = nullptr;
        bool  access = false;
    };
    struct no_order {};

    node** buckets_      = nullptr;
    size_t bucket_count_ = 0;
    size_t initial_      = DEFAULT_HASH_CAPACITY;
    size_t size_         = 0;
    size_t threshold_    = 0;
    float  load_factor_  = DEFAULT_LOAD_FACTOR;
    bool   allow_absent_ = true;
    generation gen_;
    [[no_unique_address]] std::conditional_t<LINKED, order_list, no_order> order_;
    [[no_unique_address]] HASH  hash_;
    [[no_unique_address]] EQUAL eq_;
    [[no_unique_address]] node_alloc_type   nalloc_;
    [[no_unique_address]] bucket_alloc_type balloc_;

    static constexpr size_t MAX_BUCKETS = size_t{1} << (sizeof(size_t) * 8 - 2);

    size_t index_(size_t h) const noexcept { return h & (bucket_count_ - 1); }

    void set_threshold_() noexcept {
        float t = static_cast<float>(bucket_count_) * load_factor_;
        threshold_ = t < 1.0f ? 1 : static_cast<size_t>(t);
    }

    node** alloc_buckets_(size_t n) {
        node** b = BT::allocate(balloc_, n);
        std::fill(b, b + n, nullptr);
        return b;
    }

    void free_buckets_() noexcept {
        if (buckets_) BT::deallocate(balloc_, buckets_, bucket_count_);
        buckets_ = nullptr;
        bucket_count_ = 0;
    }

    template<typename... ARGS>
    node* create_node_(size_t h, ARGS&&... args) {
        node* n = NT::allocate(nalloc_, 1);
        try {
            NT::construct(nalloc_, n, h, std::forward<ARGS>(args)...);
        } catch (...) {
            NT::deallocate(nalloc_, n, 1);
            throw;
        }
        return n;
    }

    void destroy_node_(node* n) noexcept {
        NT::destroy(nalloc_, n);
        NT::deallocate(nalloc_, n, 1);
    }

    void rehash_(size_t new_count) {
        node** fresh = alloc_buckets_(new_count);
        size_t mask = new_count - 1;
        for (size_t b = 0; b < bucket_count_; ++b) {
            node* n = buckets_[b];
            while (n) {
                node* next = n->next;
                n->next = fresh[n->hash & mask];
                fresh[n->hash & mask] = n;
                n = next;
            }
        }
        free_buckets_();
        buckets_ = fresh;
        bucket_count_ = new_count;
        set_threshold_();
    }

    // --- order list (LINKED only) ---

    void order_append_(node* n) noexcept {
        n->before = order_.tail;
        n->after = nullptr;
        if (order_.tail) order_.tail->after = n;
        else order_.head = n;
        order_.tail = n;
    }

    void order_unlink_(node* n) noexcept {
        if (n->before) n->before->after = n->after;
        else order_.head = n->after;
        if (n->after) n->after->before = n->before;
        else order_.tail = n->before;
        n->before = n->after = nullptr;
    }

    void destroy_all_() noexcept {
        for (size_t b = 0; b < bucket_count_; ++b) {
            node* n = buckets_[b];
            while (n) {
                node* next = n->next;
                destroy_node_(n);
                n = next;
            }
            buckets_[b] = nullptr;
        }
        size_ = 0;
        if constexpr (LINKED) order_.head = order_.tail = nullptr;
    }

    void steal_(hash_core& o) noexcept {
        buckets_ = o.buckets_;
        bucket_count_ = o.bucket_count_;
        size_ = o.size_;
        threshold_ = o.threshold_;
        if constexpr (LINKED) {
            order_.head = o.order_.head;
            order_.tail = o.order_.tail;
            o.order_.head = o.order_.tail = nullptr;
        }
        o.buckets_ = nullptr;
        o.bucket_count_ = 0;
        o.size_ = 0;
        o.threshold_ = 0;
        o.gen_.advance();
        gen_.advance();
    }

public:
    // ==================================================================
    // Iterators (fail-fast)
    // ==================================================================

    template<bool CONST>
    class iterator_impl {
        friend class hash_core;
        template<bool> friend class iterator_impl;
        using core_type = std::conditional_t<CONST, const hash_core, hash_core>;
        core_type* core_ = nullptr;
        node* n_ = nullptr;
        generation_check check_;
        iterator_impl(core_type* c, node* n) noexcept : core_(c), n_(n), check_(c->gen_) {}

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = VALUE;
        using difference_type   = std::ptrdiff_t;
        using pointer           = std::conditional_t<CONST, const VALUE*, VALUE*>;
        using reference         = std::conditional_t<CONST, const VALUE&, VALUE&>;

        iterator_impl() noexcept = default;
        template<bool C = CONST, typename = std::enable_if_t<C>>
        iterator_impl(const iterator_impl<false>& o) noexcept
            : core_(o.core_), n_(o.n_), check_(o.check_) {}

        reference operator*() const { check_.verify(); return n_->value; }
        pointer operator->() const { check_.verify(); return &n_->value; }

        iterator_impl& operator++() {
            check_.verify();
            n_ = core_->next_node(n_);
            return *this;
        }
        iterator_impl operator++(int) { auto t = *this; ++(*this); return t; }

        bool operator==(const iterator_impl& o) const noexcept { return n_ == o.n_; }
        bool operator!=(const iterator_impl& o) const noexcept { return n_ != o.n_; }
    };

    using iterator       = iterator_impl<false>;
    using const_iterator = iterator_impl<true>;

    // ==================================================================
    // Construction
    // ==================================================================

    explicit hash_core(const hash_options& opts = {}, const HASH& h = HASH(), const EQUAL& e = EQUAL(),
                       const ALLOC& a = ALLOC())
        : initial_(std::bit_ceil(std::max<size_t>(opts.initial_capacity, 1))),
          load_factor_(opts.load_factor), allow_absent_(opts.allow_absent_key),
          hash_(h), eq_(e), nalloc_(a), balloc_(a) {
        check_load_factor(load_factor_);
    }

    ~hash_core() {
        destroy_all_();
        free_buckets_();
    }

    hash_core(const hash_core& o)
        : initial_(o.initial_), load_factor_(o.load_factor_), allow_absent_(o.allow_absent_),
          hash_(o.hash_), eq_(o.eq_),
          nalloc_(NT::select_on_container_copy_construction(o.nalloc_)),
          balloc_(BT::select_on_container_copy_construction(o.balloc_)) {
        if constexpr (LINKED) order_.access = o.order_.access;
        try {
            if (o.bucket_count_) {
                buckets_ = alloc_buckets_(o.bucket_count_);
                bucket_count_ = o.bucket_count_;
                set_threshold_();
            }
            // Copies in iteration order so a linked table keeps its order.
            for (node* n = o.first_node(); n; n = o.next_node(n)) link_new(n->hash, n->value);
        } catch (...) {
            destroy_all_();
            free_buckets_();
            throw;
        }
    }

    hash_core(hash_core&& o) noexcept
        : initial_(o.initial_), load_factor_(o.load_factor_), allow_absent_(o.allow_absent_),
          hash_(std::move(o.hash_)), eq_(std::move(o.eq_)),
          nalloc_(std::move(o.nalloc_)), balloc_(std::move(o.balloc_)) {
        if constexpr (LINKED) order_.access = o.order_.access;
        steal_(o);
    }

    hash_core& operator=(const hash_core& o) {
        if (this != &o) {
            hash_core tmp(o);
            swap(tmp);
        }
        return *this;
    }

    hash_core& operator=(hash_core&& o) noexcept {
        if (this != &o) {
            hash_core tmp(std::move(o));
            swap(tmp);
        }
        return *this;
    }

    void swap(hash_core& o) noexcept {
        std::swap(buckets_, o.buckets_);
        std::swap(bucket_count_, o.bucket_count_);
        std::swap(initial_, o.initial_);
        std::swap(size_, o.size_);
        std::swap(threshold_, o.threshold_);
        std::swap(load_factor_, o.load_factor_);
        std::swap(allow_absent_, o.allow_absent_);
        if constexpr (LINKED) std::swap(order_, o.order_);
        std::swap(hash_, o.hash_);
        std::swap(eq_, o.eq_);
        std::swap(nalloc_, o.nalloc_);
        std::swap(balloc_, o.balloc_);
        gen_.advance();
        o.gen_.advance();
    }

    // ==================================================================
    // State
    // ==================================================================

    size_t size() const noexcept { return size_; }
    size_t bucket_count() const noexcept { return bucket_count_ ? bucket_count_ : initial_; }
    float  max_load_factor() const noexcept { return load_factor_; }
    float  load_factor() const noexcept {
        return static_cast<float>(size_) / static_cast<float>(bucket_count());
    }
    bool access_order() const noexcept {
        if constexpr (LINKED) return order_.access;
        else return false;
    }
    void set_access_order(bool on) noexcept {
        if constexpr (LINKED) order_.access = on;
    }
    const generation& gen() const noexcept { return gen_; }
    const HASH&  hash_function() const noexcept { return hash_; }
    const EQUAL& key_eq() const noexcept { return eq_; }

    // ==================================================================
    // Lookup
    // ==================================================================

    size_t hash_of(const KEY& k) const { return spread_hash(hash_(k)); }

    node* find(const KEY& k) const {
        if (size_ == 0) return nullptr;
        size_t h = hash_of(k);
        for (node* n = buckets_[index_(h)]; n; n = n->next)
            if (n->hash == h && eq_(KEYOF{}(n->value), k)) return n;
        return nullptr;
    }

    // Access-order bookkeeping after a successful lookup. Moving an entry
    // changes the iteration sequence, so it counts as structural.
    void touch(node* n) noexcept {
        if constexpr (LINKED) {
            if (order_.access && n != order_.tail) {
                order_unlink_(n);
                order_append_(n);
                gen_.advance();
            }
        }
    }

    // ==================================================================
    // Insert
    // ==================================================================

    // Links a node known to be absent. Appends to its chain.
    template<typename... ARGS>
    node* link_new(size_t h, ARGS&&... args) {
        if (!buckets_) {
            buckets_ = alloc_buckets_(initial_);
            bucket_count_ = initial_;
            set_threshold_();
        }
        node* n = create_node_(h, std::forward<ARGS>(args)...);
        node** slot = &buckets_[index_(h)];
        while (*slot) slot = &(*slot)->next;
        *slot = n;
        if constexpr (LINKED) order_append_(n);
        ++size_;
        gen_.advance();
        if (size_ >= threshold_ && bucket_count_ < MAX_BUCKETS) rehash_(bucket_count_ * 2);
        return n;
    }

    // Finds key; if absent constructs VALUE from args and links it.
    // Returns the node and whether it was inserted.
    template<typename... ARGS>
    std::pair<node*, bool> emplace_key(const KEY& key, ARGS&&... args) {
        check_absent_key(key, allow_absent_);
        size_t h = hash_of(key);
        if (size_) {
            for (node* n = buckets_[index_(h)]; n; n = n->next)
                if (n->hash == h && eq_(KEYOF{}(n->value), key)) return {n, false};
        }
        return {link_new(h, std::forward<ARGS>(args)...), true};
    }

    // ==================================================================
    // Remove
    // ==================================================================

    // Unlinks n from its chain and the order list. Caller destroys it.
    void detach(node* n) noexcept {
        node** slot = &buckets_[index_(n->hash)];
        while (*slot != n) slot = &(*slot)->next;
        *slot = n->next;
        n->next = nullptr;
        if constexpr (LINKED) order_unlink_(n);
        --size_;
        gen_.advance();
    }

    node* detach_key(const KEY& k) {
        node* n = find(k);
        if (n) detach(n);
        return n;
    }

    void release(node* n) noexcept { destroy_node_(n); }

    // Detaches and destroys n; returns the node that followed it.
    node* erase_node(node* n) noexcept {
        node* next = next_node(n);
        detach(n);
        destroy_node_(n);
        return next;
    }

    void clear() noexcept {
        destroy_all_();
        gen_.advance();
    }

    // Grows the bucket array so n entries fit under the load factor.
    void reserve(size_t n) {
        double want = static_cast<double>(n) / load_factor_;
        size_t need = want >= static_cast<double>(MAX_BUCKETS)
                          ? MAX_BUCKETS
                          : std::bit_ceil(static_cast<size_t>(want) + 1);
        if (need <= bucket_count_) return;
        if (!buckets_) {
            initial_ = std::max(initial_, need);
            return;
        }
        rehash_(need);
        gen_.advance();
    }

    // ==================================================================
    // Traversal
    // ==================================================================

    node* first_node() const noexcept {
        if constexpr (LINKED) {
            return order_.head;
        } else {
            for (size_t b = 0; b < bucket_count_; ++b)
                if (buckets_[b]) return buckets_[b];
            return nullptr;
        }
    }

    node* last_node() const noexcept {
        if constexpr (LINKED) return order_.tail;
        else return nullptr;
    }

    node* next_node(const node* n) const noexcept {
        if constexpr (LINKED) {
            return n->after;
        } else {
            if (n->next) return n->next;
            for (size_t b = index_(n->hash) + 1; b < bucket_count_; ++b)
                if (buckets_[b]) return buckets_[b];
            return nullptr;
        }
    }

    iterator       make_iterator(node* n) noexcept { return iterator(this, n); }
    const_iterator make_iterator(node* n) const noexcept { return const_iterator(this, n); }

    iterator       begin()       noexcept { return iterator(this, first_node()); }
    iterator       end()         noexcept { return iterator(this, nullptr); }
    const_iterator begin() const noexcept { return const_iterator(this, first_node()); }
    const_iterator end()   const noexcept { return const_iterator(this, nullptr); }

    static node* node_of(const const_iterator& it) noexcept { return it.n_; }
    static void verify(const const_iterator& it) { it.check_.verify(); }
};

} // namespace kcoll

#endif // KCOLL_HASH_CORE_HPP
