#ifndef KCOLL_HEAP_HPP
#define KCOLL_HEAP_HPP

#include "kcoll_array_seq.hpp"

#include <functional>
#include <optional>
#include <utility>

namespace kcoll {

// ==========================================================================
// priority_queue  -- binary min-heap keyed by COMPARE
//
// Layout: array_seq heap_, children of i at 2i+1 and 2i+2.
// Invariant: !comp(child, parent) for every parent/child pair, so the root
// is a minimum. Equal-priority items come out in no particular order.
// Iteration walks the array (heap order, not sorted) and is fail-fast.
// ==========================================================================

template<typename T, typename COMPARE = std::less<T>, typename ALLOC = std::allocator<T>>
class priority_queue {
public:
    using value_type     = T;
    using size_type      = std::size_t;
    using value_compare  = COMPARE;
    using allocator_type = ALLOC;
    using storage_type   = array_seq<T, ALLOC>;
    using const_iterator = typename storage_type::const_iterator;
    using iterator       = const_iterator;

private:
    storage_type heap_;
    [[no_unique_address]] COMPARE comp_;

    void sift_up_(size_t i) {
        T item = std::move(heap_[i]);
        while (i > 0) {
            size_t parent = (i - 1) / 2;
            if (!comp_(item, heap_[parent])) break;
            heap_[i] = std::move(heap_[parent]);
            i = parent;
        }
        heap_[i] = std::move(item);
    }

    void sift_down_(size_t i) {
        size_t n = heap_.size();
        T item = std::move(heap_[i]);
        size_t half = n / 2;
        while (i < half) {
            size_t child = 2 * i + 1;
            size_t right = child + 1;
            if (right < n && comp_(heap_[right], heap_[child])) child = right;
            if (!comp_(heap_[child], item)) break;
            heap_[i] = std::move(heap_[child]);
            i = child;
        }
        heap_[i] = std::move(item);
    }

    void heapify_() {
        for (size_t i = heap_.size() / 2; i-- > 0;) sift_down_(i);
    }

    // Removes slot i and restores the invariant from there.
    T remove_at_(size_t i) {
        size_t last = heap_.size() - 1;
        if (i == last) return heap_.pop_back();
        T out = std::move(heap_[i]);
        heap_[i] = heap_.pop_back();
        sift_down_(i);
        // The moved element may be smaller than the removed slot's parent.
        sift_up_(i);
        return out;
    }

public:
    priority_queue() = default;

    explicit priority_queue(const COMPARE& comp, size_t max_size = UNBOUNDED)
        : heap_(0, max_size), comp_(comp) {}

    template<typename IT>
    priority_queue(IT first, IT last, const COMPARE& comp = COMPARE(), size_t max_size = UNBOUNDED)
        : heap_(0, max_size), comp_(comp) {
        for (; first != last; ++first) heap_.push_back(*first);
        heapify_();
    }

    priority_queue(std::initializer_list<T> init, const COMPARE& comp = COMPARE())
        : priority_queue(init.begin(), init.end(), comp) {}

    [[nodiscard]] bool   empty()    const noexcept { return heap_.empty(); }
    [[nodiscard]] size_t size()     const noexcept { return heap_.size(); }
    [[nodiscard]] size_t max_size() const noexcept { return heap_.max_size(); }

    void offer(const T& item) {
        heap_.push_back(item);
        sift_up_(heap_.size() - 1);
    }

    void offer(T&& item) {
        heap_.push_back(std::move(item));
        sift_up_(heap_.size() - 1);
    }

    const T* peek() const noexcept { return heap_.empty() ? nullptr : &heap_[0]; }

    std::optional<T> poll() {
        if (heap_.empty()) return std::nullopt;
        return remove_at_(0);
    }

    bool contains(const T& item) const { return heap_.contains(item); }

    // Removes one element equal to item. O(n) search, O(log n) repair.
    bool remove(const T& item) {
        size_t i = heap_.index_of(item);
        if (i == storage_type::npos) return false;
        remove_at_(i);
        return true;
    }

    void clear() noexcept { heap_.clear(); }

    bool is_heap() const {
        for (size_t i = 1; i < heap_.size(); ++i)
            if (comp_(heap_[i], heap_[(i - 1) / 2])) return false;
        return true;
    }

    const_iterator begin() const noexcept { return heap_.begin(); }
    const_iterator end()   const noexcept { return heap_.end(); }

    value_compare value_comp() const { return comp_; }
};

} // namespace kcoll

#endif // KCOLL_HEAP_HPP
