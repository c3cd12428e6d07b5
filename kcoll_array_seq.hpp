#ifndef KCOLL_ARRAY_SEQ_HPP
#define KCOLL_ARRAY_SEQ_HPP

#include "kcoll_support.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace kcoll {

// ==========================================================================
// array_seq  -- contiguous growable sequence
//
// Layout: [data_ : capacity_ slots, first size_ constructed]
//
// Append is amortized O(1) through doubling growth; positional insert and
// erase shift the tail (O(n)); random access is O(1). An optional max_size
// turns it into a bounded sequence that raises capacity_overflow when full.
// ==========================================================================

template<typename T, typename ALLOC = std::allocator<T>>
class array_seq {
    using AT = std::allocator_traits<ALLOC>;

public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using allocator_type  = ALLOC;
    using reference       = T&;
    using const_reference = const T&;

    static constexpr size_t npos = static_cast<size_t>(-1);

private:
    T*     data_     = nullptr;
    size_t size_     = 0;
    size_t capacity_ = 0;
    size_t max_size_ = UNBOUNDED;
    generation gen_;
    [[no_unique_address]] ALLOC alloc_;

    void destroy_all_() noexcept {
        for (size_t i = 0; i < size_; ++i) AT::destroy(alloc_, data_ + i);
        size_ = 0;
    }

    void release_storage_() noexcept {
        destroy_all_();
        if (data_) AT::deallocate(alloc_, data_, capacity_);
        data_ = nullptr;
        capacity_ = 0;
    }

    void reallocate_(size_t new_cap) {
        T* fresh = new_cap ? AT::allocate(alloc_, new_cap) : nullptr;
        size_t built = 0;
        try {
            for (; built < size_; ++built)
                AT::construct(alloc_, fresh + built, std::move_if_noexcept(data_[built]));
        } catch (...) {
            for (size_t i = 0; i < built; ++i) AT::destroy(alloc_, fresh + i);
            AT::deallocate(alloc_, fresh, new_cap);
            throw;
        }
        size_t n = size_;
        release_storage_();
        data_ = fresh;
        size_ = n;
        capacity_ = new_cap;
    }

    template<typename... ARGS>
    T& emplace_back_(ARGS&&... args) {
        check_bound(size_, max_size_, "array_seq");
        if (size_ == capacity_) {
            // args may alias an element; build before storage moves
            T tmp(std::forward<ARGS>(args)...);
            reallocate_(grown_capacity(capacity_, max_size_));
            AT::construct(alloc_, data_ + size_, std::move(tmp));
        } else {
            AT::construct(alloc_, data_ + size_, std::forward<ARGS>(args)...);
        }
        gen_.advance();
        return data_[size_++];
    }

    void copy_from_(const array_seq& o) {
        reallocate_(o.size_);
        try {
            for (size_t i = 0; i < o.size_; ++i) {
                AT::construct(alloc_, data_ + i, o.data_[i]);
                ++size_;
            }
        } catch (...) {
            release_storage_();
            throw;
        }
    }

public:
    // ==================================================================
    // Iterators (fail-fast)
    // ==================================================================

    template<bool CONST>
    class iterator_impl {
        friend class array_seq;
        template<bool> friend class iterator_impl;
        using seq_type = std::conditional_t<CONST, const array_seq, array_seq>;
        seq_type* seq_ = nullptr;
        size_t pos_ = 0;
        generation_check check_;
        iterator_impl(seq_type* s, size_t pos) noexcept : seq_(s), pos_(pos), check_(s->gen_) {}

    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = std::conditional_t<CONST, const T*, T*>;
        using reference         = std::conditional_t<CONST, const T&, T&>;

        iterator_impl() noexcept = default;
        template<bool C = CONST, typename = std::enable_if_t<C>>
        iterator_impl(const iterator_impl<false>& o) noexcept
            : seq_(o.seq_), pos_(o.pos_), check_(o.check_) {}

        reference operator*() const { check_.verify(); return seq_->data_[pos_]; }
        pointer operator->() const { check_.verify(); return seq_->data_ + pos_; }

        iterator_impl& operator++() { check_.verify(); ++pos_; return *this; }
        iterator_impl operator++(int) { auto t = *this; ++(*this); return t; }
        iterator_impl& operator--() { check_.verify(); --pos_; return *this; }
        iterator_impl operator--(int) { auto t = *this; --(*this); return t; }

        size_t index() const noexcept { return pos_; }

        bool operator==(const iterator_impl& o) const noexcept { return pos_ == o.pos_ && seq_ == o.seq_; }
        bool operator!=(const iterator_impl& o) const noexcept { return !(*this == o); }
    };

    using iterator       = iterator_impl<false>;
    using const_iterator = iterator_impl<true>;

    // ==================================================================
    // Construction
    // ==================================================================

    array_seq() = default;

    explicit array_seq(size_t initial_capacity, size_t max_size = UNBOUNDED, const ALLOC& a = ALLOC())
        : max_size_(max_size), alloc_(a) {
        if (max_size_ == 0)
            raise(fault_kind::illegal_argument, "array_seq max_size must be positive");
        reserve(initial_capacity);
    }

    array_seq(std::initializer_list<T> init) {
        reserve(init.size());
        for (const T& v : init) push_back(v);
    }

    ~array_seq() { release_storage_(); }

    array_seq(const array_seq& o)
        : max_size_(o.max_size_), alloc_(AT::select_on_container_copy_construction(o.alloc_)) {
        copy_from_(o);
    }

    array_seq(array_seq&& o) noexcept
        : data_(o.data_), size_(o.size_), capacity_(o.capacity_), max_size_(o.max_size_),
          alloc_(std::move(o.alloc_)) {
        o.data_ = nullptr;
        o.size_ = o.capacity_ = 0;
        o.gen_.advance();
    }

    array_seq& operator=(const array_seq& o) {
        if (this != &o) {
            array_seq tmp(o);
            swap(tmp);
        }
        return *this;
    }

    array_seq& operator=(array_seq&& o) noexcept {
        if (this != &o) {
            release_storage_();
            data_ = o.data_; size_ = o.size_; capacity_ = o.capacity_; max_size_ = o.max_size_;
            alloc_ = std::move(o.alloc_);
            o.data_ = nullptr;
            o.size_ = o.capacity_ = 0;
            o.gen_.advance();
            gen_.advance();
        }
        return *this;
    }

    void swap(array_seq& o) noexcept {
        std::swap(data_, o.data_);
        std::swap(size_, o.size_);
        std::swap(capacity_, o.capacity_);
        std::swap(max_size_, o.max_size_);
        std::swap(alloc_, o.alloc_);
        gen_.advance();
        o.gen_.advance();
    }

    // ==================================================================
    // Capacity
    // ==================================================================

    [[nodiscard]] bool   empty()    const noexcept { return size_ == 0; }
    [[nodiscard]] size_t size()     const noexcept { return size_; }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t max_size() const noexcept { return max_size_; }

    void reserve(size_t n) {
        n = std::min(n, max_size_);
        if (n > capacity_) reallocate_(n);
    }

    void shrink_to_fit() {
        if (capacity_ > size_) reallocate_(size_);
    }

    // ==================================================================
    // Element access
    // ==================================================================

    T&       operator[](size_t i)       noexcept { return data_[i]; }
    const T& operator[](size_t i) const noexcept { return data_[i]; }

    T& at(size_t i) {
        if (i >= size_) raise_index_(i, size_);
        return data_[i];
    }
    const T& at(size_t i) const {
        if (i >= size_) raise_index_(i, size_);
        return data_[i];
    }

    T& front() {
        if (size_ == 0) raise(fault_kind::no_such_element, "front() on empty array_seq");
        return data_[0];
    }
    T& back() {
        if (size_ == 0) raise(fault_kind::no_such_element, "back() on empty array_seq");
        return data_[size_ - 1];
    }
    const T& front() const { return const_cast<array_seq*>(this)->front(); }
    const T& back()  const { return const_cast<array_seq*>(this)->back(); }

    T*       data()       noexcept { return data_; }
    const T* data() const noexcept { return data_; }

    // Replaces the element at i; not a structural change.
    T set(size_t i, T value) {
        if (i >= size_) raise_index_(i, size_);
        T old = std::move(data_[i]);
        data_[i] = std::move(value);
        return old;
    }

    size_t index_of(const T& value) const {
        for (size_t i = 0; i < size_; ++i)
            if (data_[i] == value) return i;
        return npos;
    }

    bool contains(const T& value) const { return index_of(value) != npos; }

    // ==================================================================
    // Modifiers
    // ==================================================================

    void push_back(const T& value) { emplace_back_(value); }
    void push_back(T&& value) { emplace_back_(std::move(value)); }

    template<typename... ARGS>
    T& emplace_back(ARGS&&... args) { return emplace_back_(std::forward<ARGS>(args)...); }

    T pop_back() {
        if (size_ == 0) raise(fault_kind::no_such_element, "pop_back() on empty array_seq");
        T out = std::move(data_[size_ - 1]);
        AT::destroy(alloc_, data_ + --size_);
        gen_.advance();
        return out;
    }

    // Stack view over the tail.
    void push(T value) { emplace_back_(std::move(value)); }
    T pop() { return pop_back(); }
    T*       peek()       noexcept { return size_ ? data_ + size_ - 1 : nullptr; }
    const T* peek() const noexcept { return size_ ? data_ + size_ - 1 : nullptr; }

    void insert(size_t index, T value) {
        if (index > size_) raise_index_(index, size_);
        if (index == size_) { emplace_back_(std::move(value)); return; }
        check_bound(size_, max_size_, "array_seq");
        if (size_ == capacity_) reallocate_(grown_capacity(capacity_, max_size_));
        AT::construct(alloc_, data_ + size_, std::move(data_[size_ - 1]));
        for (size_t i = size_ - 1; i > index; --i) data_[i] = std::move(data_[i - 1]);
        data_[index] = std::move(value);
        ++size_;
        gen_.advance();
    }

    T erase_at(size_t index) {
        if (index >= size_) raise_index_(index, size_);
        T out = std::move(data_[index]);
        for (size_t i = index; i + 1 < size_; ++i) data_[i] = std::move(data_[i + 1]);
        AT::destroy(alloc_, data_ + --size_);
        gen_.advance();
        return out;
    }

    // Removes the first element equal to value.
    bool remove(const T& value) {
        size_t i = index_of(value);
        if (i == npos) return false;
        erase_at(i);
        return true;
    }

    // Iterator-driven removal: the returned iterator tracks the new generation.
    iterator erase(const_iterator pos) {
        pos.check_.verify();
        erase_at(pos.pos_);
        return iterator(this, pos.pos_);
    }

    void clear() noexcept {
        destroy_all_();
        gen_.advance();
    }

    // ==================================================================
    // Iteration
    // ==================================================================

    iterator       begin()        noexcept { return iterator(this, 0); }
    iterator       end()          noexcept { return iterator(this, size_); }
    const_iterator begin()  const noexcept { return const_iterator(this, 0); }
    const_iterator end()    const noexcept { return const_iterator(this, size_); }
    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend()   const noexcept { return end(); }

    allocator_type get_allocator() const noexcept { return alloc_; }
};

template<typename T, typename A>
void swap(array_seq<T, A>& l, array_seq<T, A>& r) noexcept { l.swap(r); }

} // namespace kcoll

#endif // KCOLL_ARRAY_SEQ_HPP
