#ifndef KCOLL_TREE_MAP_HPP
#define KCOLL_TREE_MAP_HPP

#include "kcoll_rb_tree.hpp"

#include <functional>
#include <iterator>
#include <optional>
#include <utility>

namespace kcoll {

// ==========================================================================
// tree_map  -- ordered map over rb_tree
//
// Iteration is in increasing key order. The navigation queries (first,
// last, floor, ceiling, higher, lower) return a pointer to the nearest
// entry or null when there is none.
// ==========================================================================

template<typename KEY, typename VALUE, typename COMPARE = std::less<KEY>,
         typename ALLOC = std::allocator<std::pair<const KEY, VALUE>>>
class tree_map {
public:
    using key_type       = KEY;
    using mapped_type    = VALUE;
    using value_type     = std::pair<const KEY, VALUE>;
    using size_type      = std::size_t;
    using key_compare    = COMPARE;
    using allocator_type = ALLOC;

private:
    using tree_type = rb_tree<value_type, KEY, map_key_of, COMPARE, ALLOC>;
    using node      = typename tree_type::node;

    tree_type tree_;

    static const value_type* entry_(const node* n) noexcept { return n ? &n->value : nullptr; }

    std::optional<std::pair<KEY, VALUE>> take_(node* n) {
        if (!n) return std::nullopt;
        tree_.detach(n);
        std::optional<std::pair<KEY, VALUE>> out(std::in_place, n->value.first, std::move(n->value.second));
        tree_.release(n);
        return out;
    }

public:
    using iterator               = typename tree_type::iterator;
    using const_iterator         = typename tree_type::const_iterator;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    tree_map() = default;

    explicit tree_map(const COMPARE& comp, const ALLOC& a = ALLOC()) : tree_(comp, a) {}

    tree_map(std::initializer_list<value_type> init, const COMPARE& comp = COMPARE()) : tree_(comp) {
        for (const auto& kv : init) put(kv.first, kv.second);
    }

    [[nodiscard]] bool   empty() const noexcept { return tree_.size() == 0; }
    [[nodiscard]] size_t size()  const noexcept { return tree_.size(); }

    // ==================================================================
    // Lookup
    // ==================================================================

    VALUE* get(const KEY& key) {
        node* n = tree_.find(key);
        return n ? &n->value.second : nullptr;
    }

    const VALUE* get(const KEY& key) const {
        node* n = tree_.find(key);
        return n ? &n->value.second : nullptr;
    }

    VALUE& at(const KEY& key) {
        VALUE* v = get(key);
        if (!v) raise(fault_kind::not_found, "key not present in tree map");
        return *v;
    }

    const VALUE& at(const KEY& key) const {
        const VALUE* v = get(key);
        if (!v) raise(fault_kind::not_found, "key not present in tree map");
        return *v;
    }

    VALUE get_or(const KEY& key, VALUE fallback) const {
        const VALUE* v = get(key);
        return v ? *v : std::move(fallback);
    }

    bool contains_key(const KEY& key) const { return tree_.find(key) != nullptr; }

    const value_type* first() const noexcept { return entry_(tree_.first_node()); }
    const value_type* last()  const noexcept { return entry_(tree_.last_node()); }

    const value_type* floor(const KEY& key)   const { return entry_(tree_.floor(key)); }
    const value_type* ceiling(const KEY& key) const { return entry_(tree_.ceiling(key)); }
    const value_type* higher(const KEY& key)  const { return entry_(tree_.higher(key)); }
    const value_type* lower(const KEY& key)   const { return entry_(tree_.lower(key)); }

    // ==================================================================
    // Insert / replace
    // ==================================================================

    // Returns the previous value when key was present.
    std::optional<VALUE> put(const KEY& key, VALUE value) {
        auto [n, inserted] = tree_.emplace_unique(key, key, std::move(value));
        if (inserted) return std::nullopt;
        return std::optional<VALUE>(std::exchange(n->value.second, std::move(value)));
    }

    bool put_if_absent(const KEY& key, VALUE value) {
        return tree_.emplace_unique(key, key, std::move(value)).second;
    }

    VALUE& insert_unique(const KEY& key, VALUE value) {
        auto [n, inserted] = tree_.emplace_unique(key, key, std::move(value));
        if (!inserted) raise(fault_kind::duplicate_key, "key already present in tree map");
        return n->value.second;
    }

    // ==================================================================
    // Remove
    // ==================================================================

    std::optional<VALUE> remove(const KEY& key) {
        node* n = tree_.find(key);
        if (!n) return std::nullopt;
        tree_.detach(n);
        std::optional<VALUE> out(std::move(n->value.second));
        tree_.release(n);
        return out;
    }

    std::optional<std::pair<KEY, VALUE>> pop_first() { return take_(tree_.first_node()); }
    std::optional<std::pair<KEY, VALUE>> pop_last()  { return take_(tree_.last_node()); }

    iterator erase(const_iterator pos) {
        tree_type::verify(pos);
        return tree_.make_iterator(tree_.erase_node(tree_type::node_of(pos)));
    }

    void clear() noexcept { tree_.clear(); }

    void swap(tree_map& o) noexcept { tree_.swap(o.tree_); }

    bool validate() const { return tree_.validate(); }

    const COMPARE& key_comp() const noexcept { return tree_.key_comp(); }

    // ==================================================================
    // Iteration
    // ==================================================================

    iterator       begin()        noexcept { return tree_.begin(); }
    iterator       end()          noexcept { return tree_.end(); }
    const_iterator begin()  const noexcept { return tree_.begin(); }
    const_iterator end()    const noexcept { return tree_.end(); }
    const_iterator cbegin() const noexcept { return tree_.begin(); }
    const_iterator cend()   const noexcept { return tree_.end(); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator(end()); }
    reverse_iterator       rend()         noexcept { return reverse_iterator(begin()); }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    const_reverse_iterator rend()   const noexcept { return const_reverse_iterator(begin()); }
};

// ==========================================================================
// tree_set
// ==========================================================================

template<typename KEY, typename COMPARE = std::less<KEY>, typename ALLOC = std::allocator<KEY>>
class tree_set {
public:
    using key_type       = KEY;
    using value_type     = KEY;
    using size_type      = std::size_t;
    using key_compare    = COMPARE;
    using allocator_type = ALLOC;

private:
    using tree_type = rb_tree<KEY, KEY, set_key_of, COMPARE, ALLOC>;
    using node      = typename tree_type::node;

    tree_type tree_;

    static const KEY* key_(const node* n) noexcept { return n ? &n->value : nullptr; }

    std::optional<KEY> take_(node* n) {
        if (!n) return std::nullopt;
        tree_.detach(n);
        std::optional<KEY> out(std::move(n->value));
        tree_.release(n);
        return out;
    }

public:
    using iterator               = typename tree_type::const_iterator;
    using const_iterator         = typename tree_type::const_iterator;
    using reverse_iterator       = std::reverse_iterator<const_iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    tree_set() = default;

    explicit tree_set(const COMPARE& comp, const ALLOC& a = ALLOC()) : tree_(comp, a) {}

    tree_set(std::initializer_list<KEY> init, const COMPARE& comp = COMPARE()) : tree_(comp) {
        for (const auto& k : init) add(k);
    }

    [[nodiscard]] bool   empty() const noexcept { return tree_.size() == 0; }
    [[nodiscard]] size_t size()  const noexcept { return tree_.size(); }

    // True when key was not already present.
    bool add(const KEY& key) { return tree_.emplace_unique(key, key).second; }

    void insert_unique(const KEY& key) {
        if (!add(key)) raise(fault_kind::duplicate_key, "key already present in tree set");
    }

    bool contains(const KEY& key) const { return tree_.find(key) != nullptr; }

    bool remove(const KEY& key) {
        node* n = tree_.find(key);
        if (!n) return false;
        tree_.erase_node(n);
        return true;
    }

    const KEY* first() const noexcept { return key_(tree_.first_node()); }
    const KEY* last()  const noexcept { return key_(tree_.last_node()); }

    const KEY* floor(const KEY& key)   const { return key_(tree_.floor(key)); }
    const KEY* ceiling(const KEY& key) const { return key_(tree_.ceiling(key)); }
    const KEY* higher(const KEY& key)  const { return key_(tree_.higher(key)); }
    const KEY* lower(const KEY& key)   const { return key_(tree_.lower(key)); }

    std::optional<KEY> pop_first() { return take_(tree_.first_node()); }
    std::optional<KEY> pop_last()  { return take_(tree_.last_node()); }

    iterator erase(const_iterator pos) {
        tree_type::verify(pos);
        node* next = tree_.erase_node(tree_type::node_of(pos));
        return std::as_const(tree_).make_iterator(next);
    }

    void clear() noexcept { tree_.clear(); }

    void swap(tree_set& o) noexcept { tree_.swap(o.tree_); }

    bool validate() const { return tree_.validate(); }

    const_iterator begin()  const noexcept { return tree_.begin(); }
    const_iterator end()    const noexcept { return tree_.end(); }
    const_iterator cbegin() const noexcept { return tree_.begin(); }
    const_iterator cend()   const noexcept { return tree_.end(); }

    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    const_reverse_iterator rend()   const noexcept { return const_reverse_iterator(begin()); }
};

template<typename K, typename V, typename C, typename A>
void swap(tree_map<K, V, C, A>& l, tree_map<K, V, C, A>& r) noexcept { l.swap(r); }

template<typename K, typename C, typename A>
void swap(tree_set<K, C, A>& l, tree_set<K, C, A>& r) noexcept { l.swap(r); }

} // namespace kcoll

#endif // KCOLL_TREE_MAP_HPP
