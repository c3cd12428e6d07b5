#ifndef KCOLL_RB_TREE_HPP
#define KCOLL_RB_TREE_HPP

#include "kcoll_support.hpp"

#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace kcoll {

template<typename VALUE>
struct rb_node {
    rb_node* left   = nullptr;
    rb_node* right  = nullptr;
    rb_node* parent = nullptr;
    bool     red    = true;
    VALUE    value;

    template<typename... ARGS>
    explicit rb_node(ARGS&&... args) : value(std::forward<ARGS>(args)...) {}
};

// ==========================================================================
// rb_tree  -- red-black search tree shared by tree_map and tree_set
//
// Leaves are null. Invariants:
//   in-order keys strictly increasing under COMPARE
//   root black, no red node with a red child
//   every root-to-null path crosses the same number of black nodes
// so height <= 2 log2(n + 1).
//
// Erase relinks nodes instead of moving values, so node addresses (and the
// const keys they hold) are stable for the life of an entry.
// ==========================================================================

template<typename VALUE, typename KEY, typename KEYOF, typename COMPARE, typename ALLOC>
class rb_tree {
public:
    using node = rb_node<VALUE>;

private:
    using node_alloc_type = typename std::allocator_traits<ALLOC>::template rebind_alloc<node>;
    using NT = std::allocator_traits<node_alloc_type>;

    node*  root_ = nullptr;
    size_t size_ = 0;
    generation gen_;
    [[no_unique_address]] COMPARE comp_;
    [[no_unique_address]] node_alloc_type nalloc_;

    static const KEY& key_(const node* n) noexcept { return KEYOF{}(n->value); }
    static bool is_red_(const node* n) noexcept { return n && n->red; }

    template<typename... ARGS>
    node* create_node_(ARGS&&... args) {
        node* n = NT::allocate(nalloc_, 1);
        try {
            NT::construct(nalloc_, n, std::forward<ARGS>(args)...);
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

    void destroy_subtree_(node* n) noexcept {
        while (n) {
            destroy_subtree_(n->right);
            node* l = n->left;
            destroy_node_(n);
            n = l;
        }
    }

    node* clone_(const node* s, node* parent) {
        node* n = create_node_(s->value);
        n->red = s->red;
        n->parent = parent;
        try {
            if (s->left) n->left = clone_(s->left, n);
            if (s->right) n->right = clone_(s->right, n);
        } catch (...) {
            destroy_subtree_(n);
            throw;
        }
        return n;
    }

    // --- rotations ---

    void rotate_left_(node* x) noexcept {
        node* y = x->right;
        x->right = y->left;
        if (y->left) y->left->parent = x;
        y->parent = x->parent;
        if (!x->parent) root_ = y;
        else if (x == x->parent->left) x->parent->left = y;
        else x->parent->right = y;
        y->left = x;
        x->parent = y;
    }

    void rotate_right_(node* x) noexcept {
        node* y = x->left;
        x->left = y->right;
        if (y->right) y->right->parent = x;
        y->parent = x->parent;
        if (!x->parent) root_ = y;
        else if (x == x->parent->right) x->parent->right = y;
        else x->parent->left = y;
        y->right = x;
        x->parent = y;
    }

    void replace_child_(node* u, node* v) noexcept {
        if (!u->parent) root_ = v;
        else if (u == u->parent->left) u->parent->left = v;
        else u->parent->right = v;
        if (v) v->parent = u->parent;
    }

    void insert_fixup_(node* z) noexcept {
        while (z != root_ && z->parent->red) {
            node* p = z->parent;
            node* g = p->parent;
            if (p == g->left) {
                node* u = g->right;
                if (is_red_(u)) {
                    p->red = u->red = false;
                    g->red = true;
                    z = g;
                    continue;
                }
                if (z == p->right) {
                    z = p;
                    rotate_left_(z);
                    p = z->parent;
                }
                p->red = false;
                g->red = true;
                rotate_right_(g);
            } else {
                node* u = g->left;
                if (is_red_(u)) {
                    p->red = u->red = false;
                    g->red = true;
                    z = g;
                    continue;
                }
                if (z == p->left) {
                    z = p;
                    rotate_right_(z);
                    p = z->parent;
                }
                p->red = false;
                g->red = true;
                rotate_left_(g);
            }
        }
        root_->red = false;
    }

    // x replaced a removed black node and may be null; xp is its parent.
    void erase_fixup_(node* x, node* xp) noexcept {
        while (x != root_ && !is_red_(x)) {
            if (x == xp->left) {
                node* w = xp->right;
                if (w->red) {
                    w->red = false;
                    xp->red = true;
                    rotate_left_(xp);
                    w = xp->right;
                }
                if (!is_red_(w->left) && !is_red_(w->right)) {
                    w->red = true;
                    x = xp;
                    xp = x->parent;
                } else {
                    if (!is_red_(w->right)) {
                        w->left->red = false;
                        w->red = true;
                        rotate_right_(w);
                        w = xp->right;
                    }
                    w->red = xp->red;
                    xp->red = false;
                    w->right->red = false;
                    rotate_left_(xp);
                    x = root_;
                }
            } else {
                node* w = xp->left;
                if (w->red) {
                    w->red = false;
                    xp->red = true;
                    rotate_right_(xp);
                    w = xp->left;
                }
                if (!is_red_(w->left) && !is_red_(w->right)) {
                    w->red = true;
                    x = xp;
                    xp = x->parent;
                } else {
                    if (!is_red_(w->left)) {
                        w->right->red = false;
                        w->red = true;
                        rotate_left_(w);
                        w = xp->left;
                    }
                    w->red = xp->red;
                    xp->red = false;
                    w->left->red = false;
                    rotate_right_(xp);
                    x = root_;
                }
            }
        }
        if (x) x->red = false;
    }

    void unlink_(node* z) noexcept {
        node* y = z;
        bool removed_red = y->red;
        node* x;
        node* xp;
        if (!z->left) {
            x = z->right;
            xp = z->parent;
            replace_child_(z, z->right);
        } else if (!z->right) {
            x = z->left;
            xp = z->parent;
            replace_child_(z, z->left);
        } else {
            y = min_of(z->right);
            removed_red = y->red;
            x = y->right;
            if (y->parent == z) {
                xp = y;
            } else {
                xp = y->parent;
                replace_child_(y, y->right);
                y->right = z->right;
                y->right->parent = y;
            }
            replace_child_(z, y);
            y->left = z->left;
            y->left->parent = y;
            y->red = z->red;
        }
        if (!removed_red) erase_fixup_(x, xp);
        z->left = z->right = z->parent = nullptr;
    }

    // Returns black height, or -1 on any violation.
    int check_subtree_(const node* n, const node* parent) const {
        if (!n) return 1;
        if (n->parent != parent) return -1;
        if (n->red && is_red_(parent)) return -1;
        int l = check_subtree_(n->left, n);
        int r = check_subtree_(n->right, n);
        if (l < 0 || r < 0 || l != r) return -1;
        return l + (n->red ? 0 : 1);
    }

public:
    // ==================================================================
    // Navigation
    // ==================================================================

    static node* min_of(node* n) noexcept {
        while (n->left) n = n->left;
        return n;
    }

    static node* max_of(node* n) noexcept {
        while (n->right) n = n->right;
        return n;
    }

    static node* next_of(node* n) noexcept {
        if (n->right) return min_of(n->right);
        node* p = n->parent;
        while (p && n == p->right) { n = p; p = p->parent; }
        return p;
    }

    static node* prev_of(node* n) noexcept {
        if (n->left) return max_of(n->left);
        node* p = n->parent;
        while (p && n == p->left) { n = p; p = p->parent; }
        return p;
    }

    // ==================================================================
    // Iterators (fail-fast, bidirectional; end is the null node)
    // ==================================================================

    template<bool CONST>
    class iterator_impl {
        friend class rb_tree;
        template<bool> friend class iterator_impl;
        using tree_type = std::conditional_t<CONST, const rb_tree, rb_tree>;
        tree_type* tree_ = nullptr;
        node* n_ = nullptr;
        generation_check check_;
        iterator_impl(tree_type* t, node* n) noexcept : tree_(t), n_(n), check_(t->gen_) {}

    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = VALUE;
        using difference_type   = std::ptrdiff_t;
        using pointer           = std::conditional_t<CONST, const VALUE*, VALUE*>;
        using reference         = std::conditional_t<CONST, const VALUE&, VALUE&>;

        iterator_impl() noexcept = default;
        template<bool C = CONST, typename = std::enable_if_t<C>>
        iterator_impl(const iterator_impl<false>& o) noexcept
            : tree_(o.tree_), n_(o.n_), check_(o.check_) {}

        reference operator*() const { check_.verify(); return n_->value; }
        pointer operator->() const { check_.verify(); return &n_->value; }

        iterator_impl& operator++() {
            check_.verify();
            n_ = next_of(n_);
            return *this;
        }
        iterator_impl operator++(int) { auto t = *this; ++(*this); return t; }

        iterator_impl& operator--() {
            check_.verify();
            n_ = n_ ? prev_of(n_) : tree_->last_node();
            return *this;
        }
        iterator_impl operator--(int) { auto t = *this; --(*this); return t; }

        bool operator==(const iterator_impl& o) const noexcept { return n_ == o.n_; }
        bool operator!=(const iterator_impl& o) const noexcept { return n_ != o.n_; }
    };

    using iterator       = iterator_impl<false>;
    using const_iterator = iterator_impl<true>;

    // ==================================================================
    // Construction
    // ==================================================================

    explicit rb_tree(const COMPARE& comp = COMPARE(), const ALLOC& a = ALLOC())
        : comp_(comp), nalloc_(a) {}

    ~rb_tree() { destroy_subtree_(root_); }

    rb_tree(const rb_tree& o)
        : size_(o.size_), comp_(o.comp_),
          nalloc_(NT::select_on_container_copy_construction(o.nalloc_)) {
        if (o.root_) root_ = clone_(o.root_, nullptr);
    }

    rb_tree(rb_tree&& o) noexcept
        : root_(o.root_), size_(o.size_), comp_(std::move(o.comp_)), nalloc_(std::move(o.nalloc_)) {
        o.root_ = nullptr;
        o.size_ = 0;
        o.gen_.advance();
    }

    rb_tree& operator=(const rb_tree& o) {
        if (this != &o) {
            rb_tree tmp(o);
            swap(tmp);
        }
        return *this;
    }

    rb_tree& operator=(rb_tree&& o) noexcept {
        if (this != &o) {
            rb_tree tmp(std::move(o));
            swap(tmp);
        }
        return *this;
    }

    void swap(rb_tree& o) noexcept {
        std::swap(root_, o.root_);
        std::swap(size_, o.size_);
        std::swap(comp_, o.comp_);
        std::swap(nalloc_, o.nalloc_);
        gen_.advance();
        o.gen_.advance();
    }

    size_t size() const noexcept { return size_; }
    const COMPARE& key_comp() const noexcept { return comp_; }

    // ==================================================================
    // Lookup
    // ==================================================================

    node* find(const KEY& k) const {
        node* n = root_;
        while (n) {
            if (comp_(k, key_(n))) n = n->left;
            else if (comp_(key_(n), k)) n = n->right;
            else return n;
        }
        return nullptr;
    }

    // Smallest entry >= k.
    node* ceiling(const KEY& k) const {
        node* n = root_;
        node* best = nullptr;
        while (n) {
            if (comp_(key_(n), k)) n = n->right;
            else { best = n; n = n->left; }
        }
        return best;
    }

    // Smallest entry > k.
    node* higher(const KEY& k) const {
        node* n = root_;
        node* best = nullptr;
        while (n) {
            if (comp_(k, key_(n))) { best = n; n = n->left; }
            else n = n->right;
        }
        return best;
    }

    // Largest entry <= k.
    node* floor(const KEY& k) const {
        node* n = root_;
        node* best = nullptr;
        while (n) {
            if (comp_(k, key_(n))) n = n->left;
            else { best = n; n = n->right; }
        }
        return best;
    }

    // Largest entry < k.
    node* lower(const KEY& k) const {
        node* n = root_;
        node* best = nullptr;
        while (n) {
            if (comp_(key_(n), k)) { best = n; n = n->right; }
            else n = n->left;
        }
        return best;
    }

    node* first_node() const noexcept { return root_ ? min_of(root_) : nullptr; }
    node* last_node()  const noexcept { return root_ ? max_of(root_) : nullptr; }

    // ==================================================================
    // Insert
    // ==================================================================

    // Finds key; if absent constructs VALUE from args and links it.
    // Comparator probes run before any change, so a contract fault leaves
    // the tree as it was.
    template<typename... ARGS>
    std::pair<node*, bool> emplace_unique(const KEY& key, ARGS&&... args) {
        check_irreflexive(comp_, key);
        node* parent = nullptr;
        node* n = root_;
        bool go_left = false;
        while (n) {
            parent = n;
            if (comp_(key, key_(n))) { go_left = true; n = n->left; }
            else if (comp_(key_(n), key)) { go_left = false; n = n->right; }
            else return {n, false};
        }
        if (parent) check_asymmetric(comp_, key, key_(parent));

        node* z = create_node_(std::forward<ARGS>(args)...);
        z->parent = parent;
        if (!parent) root_ = z;
        else if (go_left) parent->left = z;
        else parent->right = z;
        insert_fixup_(z);
        ++size_;
        gen_.advance();
        return {z, true};
    }

    // ==================================================================
    // Remove
    // ==================================================================

    // Unlinks n and rebalances. Caller destroys it via release().
    void detach(node* n) noexcept {
        unlink_(n);
        --size_;
        gen_.advance();
    }

    void release(node* n) noexcept { destroy_node_(n); }

    // Detaches and destroys n; returns its in-order successor.
    node* erase_node(node* n) noexcept {
        node* next = next_of(n);
        detach(n);
        destroy_node_(n);
        return next;
    }

    void clear() noexcept {
        destroy_subtree_(root_);
        root_ = nullptr;
        size_ = 0;
        gen_.advance();
    }

    // Full structural check: order, colors, black height, parent links, size.
    bool validate() const {
        if (!root_) return size_ == 0;
        if (root_->red || root_->parent) return false;
        if (check_subtree_(root_, nullptr) < 0) return false;
        size_t count = 0;
        node* prev = nullptr;
        for (node* n = first_node(); n; prev = n, n = next_of(n)) {
            if (prev && !comp_(key_(prev), key_(n))) return false;
            ++count;
        }
        return count == size_;
    }

    // ==================================================================
    // Iteration
    // ==================================================================

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

#endif // KCOLL_RB_TREE_HPP
