#ifndef KCOLL_DEQUE_HPP
#define KCOLL_DEQUE_HPP

#include "kcoll_support.hpp"

#include <algorithm>
#include <bit>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace kcoll {

// ==========================================================================
// ring_deque  -- double-ended queue over a circular buffer
//
// Layout: [buf_ : capacity_ slots], live range head_ .. head_+size_ (mod cap)
//
// Capacity is a power of two so slot(i) = (head_ + i) & (capacity_ - 1).
// When full, the buffer is reallocated at double capacity and the live range
// is recentered to start at slot 0. Push/pop at either end is amortized O(1).
// A bounded deque never allocates past bit_ceil(max_size).
// ==========================================================================

template<typename T, typename ALLOC = std::allocator<T>>
class ring_deque {
    using AT = std::allocator_traits<ALLOC>;

public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using allocator_type  = ALLOC;

private:
    T*     buf_      = nullptr;
    size_t capacity_ = 0;
    size_t head_     = 0;
    size_t size_     = 0;
    size_t max_size_ = UNBOUNDED;
    generation gen_;
    [[no_unique_address]] ALLOC alloc_;

    size_t slot_(size_t logical) const noexcept { return (head_ + logical) & (capacity_ - 1); }

    void destroy_all_() noexcept {
        for (size_t i = 0; i < size_; ++i) AT::destroy(alloc_, buf_ + slot_(i));
        size_ = 0;
        head_ = 0;
    }

    void release_storage_() noexcept {
        destroy_all_();
        if (buf_) AT::deallocate(alloc_, buf_, capacity_);
        buf_ = nullptr;
        capacity_ = 0;
    }

    void reallocate_(size_t new_cap) {
        T* fresh = AT::allocate(alloc_, new_cap);
        size_t built = 0;
        try {
            for (; built < size_; ++built)
                AT::construct(alloc_, fresh + built, std::move_if_noexcept(buf_[slot_(built)]));
        } catch (...) {
            for (size_t i = 0; i < built; ++i) AT::destroy(alloc_, fresh + i);
            AT::deallocate(alloc_, fresh, new_cap);
            throw;
        }
        size_t n = size_;
        release_storage_();
        buf_ = fresh;
        capacity_ = new_cap;
        size_ = n;
        head_ = 0;
    }

    // Smallest power of two holding max_size_ elements.
    size_t capacity_limit_() const noexcept {
        return max_size_ > (UNBOUNDED >> 1) + 1 ? (UNBOUNDED >> 1) + 1 : std::bit_ceil(max_size_);
    }

    size_t bounded_capacity_(size_t n) const noexcept {
        size_t limit = capacity_limit_();
        n = std::max(n, MIN_SEQ_CAPACITY);
        return n >= limit ? limit : std::bit_ceil(n);
    }

    void grow_if_full_() {
        check_bound(size_, max_size_, "ring_deque");
        if (size_ == capacity_)
            reallocate_(capacity_ ? capacity_ * 2 : bounded_capacity_(MIN_SEQ_CAPACITY));
    }

    template<typename... ARGS>
    T& emplace_back_(ARGS&&... args) {
        if (size_ == capacity_) {
            T tmp(std::forward<ARGS>(args)...);
            grow_if_full_();
            AT::construct(alloc_, buf_ + slot_(size_), std::move(tmp));
        } else {
            check_bound(size_, max_size_, "ring_deque");
            AT::construct(alloc_, buf_ + slot_(size_), std::forward<ARGS>(args)...);
        }
        gen_.advance();
        return buf_[slot_(size_++)];
    }

    template<typename... ARGS>
    T& emplace_front_(ARGS&&... args) {
        if (size_ == capacity_) {
            T tmp(std::forward<ARGS>(args)...);
            grow_if_full_();
            size_t h = (head_ - 1) & (capacity_ - 1);
            AT::construct(alloc_, buf_ + h, std::move(tmp));
            head_ = h;
        } else {
            check_bound(size_, max_size_, "ring_deque");
            size_t h = (head_ - 1) & (capacity_ - 1);
            AT::construct(alloc_, buf_ + h, std::forward<ARGS>(args)...);
            head_ = h;
        }
        ++size_;
        gen_.advance();
        return buf_[head_];
    }

    T take_front_() {
        T out = std::move(buf_[head_]);
        AT::destroy(alloc_, buf_ + head_);
        head_ = (head_ + 1) & (capacity_ - 1);
        --size_;
        gen_.advance();
        return out;
    }

    T take_back_() {
        size_t s = slot_(size_ - 1);
        T out = std::move(buf_[s]);
        AT::destroy(alloc_, buf_ + s);
        --size_;
        gen_.advance();
        return out;
    }

    // Shifts the elements after `logical` one step toward the front.
    T erase_logical_(size_t logical) {
        T out = std::move(buf_[slot_(logical)]);
        for (size_t i = logical; i + 1 < size_; ++i)
            buf_[slot_(i)] = std::move(buf_[slot_(i + 1)]);
        AT::destroy(alloc_, buf_ + slot_(size_ - 1));
        --size_;
        gen_.advance();
        return out;
    }

public:
    // ==================================================================
    // Iterators (fail-fast, front to back)
    // ==================================================================

    template<bool CONST>
    class iterator_impl {
        friend class ring_deque;
        template<bool> friend class iterator_impl;
        using deque_type = std::conditional_t<CONST, const ring_deque, ring_deque>;
        deque_type* dq_ = nullptr;
        size_t pos_ = 0;
        generation_check check_;
        iterator_impl(deque_type* d, size_t pos) noexcept : dq_(d), pos_(pos), check_(d->gen_) {}

    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = std::conditional_t<CONST, const T*, T*>;
        using reference         = std::conditional_t<CONST, const T&, T&>;

        iterator_impl() noexcept = default;
        template<bool C = CONST, typename = std::enable_if_t<C>>
        iterator_impl(const iterator_impl<false>& o) noexcept
            : dq_(o.dq_), pos_(o.pos_), check_(o.check_) {}

        reference operator*() const { check_.verify(); return dq_->buf_[dq_->slot_(pos_)]; }
        pointer operator->() const { check_.verify(); return dq_->buf_ + dq_->slot_(pos_); }

        iterator_impl& operator++() { check_.verify(); ++pos_; return *this; }
        iterator_impl operator++(int) { auto t = *this; ++(*this); return t; }
        iterator_impl& operator--() { check_.verify(); --pos_; return *this; }
        iterator_impl operator--(int) { auto t = *this; --(*this); return t; }

        bool operator==(const iterator_impl& o) const noexcept { return pos_ == o.pos_ && dq_ == o.dq_; }
        bool operator!=(const iterator_impl& o) const noexcept { return !(*this == o); }
    };

    using iterator       = iterator_impl<false>;
    using const_iterator = iterator_impl<true>;

    // ==================================================================
    // Construction
    // ==================================================================

    ring_deque() = default;

    explicit ring_deque(size_t initial_capacity, size_t max_size = UNBOUNDED, const ALLOC& a = ALLOC())
        : max_size_(max_size), alloc_(a) {
        if (max_size_ == 0)
            raise(fault_kind::illegal_argument, "ring_deque max_size must be positive");
        if (initial_capacity)
            reallocate_(bounded_capacity_(initial_capacity));
    }

    ~ring_deque() { release_storage_(); }

    ring_deque(const ring_deque& o)
        : max_size_(o.max_size_), alloc_(AT::select_on_container_copy_construction(o.alloc_)) {
        if (o.size_) reallocate_(std::bit_ceil(o.size_));
        try {
            for (size_t i = 0; i < o.size_; ++i) {
                AT::construct(alloc_, buf_ + i, o.buf_[o.slot_(i)]);
                ++size_;
            }
        } catch (...) {
            release_storage_();
            throw;
        }
    }

    ring_deque(ring_deque&& o) noexcept
        : buf_(o.buf_), capacity_(o.capacity_), head_(o.head_), size_(o.size_),
          max_size_(o.max_size_), alloc_(std::move(o.alloc_)) {
        o.buf_ = nullptr;
        o.capacity_ = o.head_ = o.size_ = 0;
        o.gen_.advance();
    }

    ring_deque& operator=(const ring_deque& o) {
        if (this != &o) {
            ring_deque tmp(o);
            swap(tmp);
        }
        return *this;
    }

    ring_deque& operator=(ring_deque&& o) noexcept {
        if (this != &o) {
            ring_deque tmp(std::move(o));
            swap(tmp);
        }
        return *this;
    }

    void swap(ring_deque& o) noexcept {
        std::swap(buf_, o.buf_);
        std::swap(capacity_, o.capacity_);
        std::swap(head_, o.head_);
        std::swap(size_, o.size_);
        std::swap(max_size_, o.max_size_);
        std::swap(alloc_, o.alloc_);
        gen_.advance();
        o.gen_.advance();
    }

    [[nodiscard]] bool   empty()    const noexcept { return size_ == 0; }
    [[nodiscard]] size_t size()     const noexcept { return size_; }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t max_size() const noexcept { return max_size_; }

    // ==================================================================
    // Ends
    // ==================================================================

    void push_front(const T& v) { emplace_front_(v); }
    void push_front(T&& v) { emplace_front_(std::move(v)); }
    void push_back(const T& v) { emplace_back_(v); }
    void push_back(T&& v) { emplace_back_(std::move(v)); }

    template<typename... ARGS>
    T& emplace_front(ARGS&&... args) { return emplace_front_(std::forward<ARGS>(args)...); }
    template<typename... ARGS>
    T& emplace_back(ARGS&&... args) { return emplace_back_(std::forward<ARGS>(args)...); }

    T pop_front() {
        if (size_ == 0) raise(fault_kind::no_such_element, "pop_front() on empty ring_deque");
        return take_front_();
    }

    T pop_back() {
        if (size_ == 0) raise(fault_kind::no_such_element, "pop_back() on empty ring_deque");
        return take_back_();
    }

    std::optional<T> poll_front() {
        if (size_ == 0) return std::nullopt;
        return take_front_();
    }

    std::optional<T> poll_back() {
        if (size_ == 0) return std::nullopt;
        return take_back_();
    }

    T*       peek_front()       noexcept { return size_ ? buf_ + head_ : nullptr; }
    const T* peek_front() const noexcept { return size_ ? buf_ + head_ : nullptr; }
    T*       peek_back()        noexcept { return size_ ? buf_ + slot_(size_ - 1) : nullptr; }
    const T* peek_back()  const noexcept { return size_ ? buf_ + slot_(size_ - 1) : nullptr; }

    T& front() {
        if (size_ == 0) raise(fault_kind::no_such_element, "front() on empty ring_deque");
        return buf_[head_];
    }
    T& back() {
        if (size_ == 0) raise(fault_kind::no_such_element, "back() on empty ring_deque");
        return buf_[slot_(size_ - 1)];
    }
    const T& front() const { return const_cast<ring_deque*>(this)->front(); }
    const T& back()  const { return const_cast<ring_deque*>(this)->back(); }

    // Stack view over the front.
    void push(T v) { emplace_front_(std::move(v)); }
    T pop() { return pop_front(); }
    T*       peek()       noexcept { return peek_front(); }
    const T* peek() const noexcept { return peek_front(); }

    // ==================================================================
    // Positional access
    // ==================================================================

    T&       operator[](size_t i)       noexcept { return buf_[slot_(i)]; }
    const T& operator[](size_t i) const noexcept { return buf_[slot_(i)]; }

    T& at(size_t i) {
        if (i >= size_) raise_index_(i, size_);
        return buf_[slot_(i)];
    }
    const T& at(size_t i) const {
        if (i >= size_) raise_index_(i, size_);
        return buf_[slot_(i)];
    }

    bool contains(const T& v) const {
        for (size_t i = 0; i < size_; ++i)
            if (buf_[slot_(i)] == v) return true;
        return false;
    }

    // Removes the first element equal to v.
    bool remove(const T& v) {
        for (size_t i = 0; i < size_; ++i) {
            if (buf_[slot_(i)] == v) { erase_logical_(i); return true; }
        }
        return false;
    }

    iterator erase(const_iterator pos) {
        pos.check_.verify();
        if (pos.pos_ >= size_) raise_index_(pos.pos_, size_);
        erase_logical_(pos.pos_);
        return iterator(this, pos.pos_);
    }

    void clear() noexcept {
        destroy_all_();
        gen_.advance();
    }

    iterator       begin()        noexcept { return iterator(this, 0); }
    iterator       end()          noexcept { return iterator(this, size_); }
    const_iterator begin()  const noexcept { return const_iterator(this, 0); }
    const_iterator end()    const noexcept { return const_iterator(this, size_); }
    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend()   const noexcept { return end(); }

    allocator_type get_allocator() const noexcept { return alloc_; }
};

template<typename T, typename A>
void swap(ring_deque<T, A>& l, ring_deque<T, A>& r) noexcept { l.swap(r); }

} // namespace kcoll

#endif // KCOLL_DEQUE_HPP
