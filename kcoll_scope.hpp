#ifndef KCOLL_SCOPE_HPP
#define KCOLL_SCOPE_HPP

#include "kcoll_fault.hpp"

#include <cstdio>
#include <exception>
#include <functional>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace kcoll {

// ==========================================================================
// Foreign exception translation
//
// Must be called from inside a catch block. fault passes through unchanged;
// std::bad_alloc becomes resource_exhausted (fatal); anything else becomes
// external (defect).
// ==========================================================================

inline fault current_fault() {
    try {
        throw;
    } catch (const fault& f) {
        return f;
    } catch (const std::bad_alloc&) {
        return fault(fault_kind::resource_exhausted, "allocation failed");
    } catch (const std::exception& e) {
        return fault(fault_kind::external, e.what());
    } catch (...) {
        return fault(fault_kind::external, "unknown exception");
    }
}

// ==========================================================================
// resource_slot  -- one held resource plus its releaser
// ==========================================================================

class resource_slot {
public:
    virtual ~resource_slot() = default;

    // Runs the releaser. Non-fault exceptions surface as resource_close.
    void release_now() {
        try {
            do_release_();
        } catch (const fault&) {
            throw;
        } catch (const std::exception& e) {
            throw fault(fault_kind::resource_close, std::string("release failed: ") + e.what());
        } catch (...) {
            throw fault(fault_kind::resource_close, "release failed: unknown exception");
        }
    }

    virtual const void* address() const noexcept = 0;

private:
    virtual void do_release_() = 0;
};

template<typename R>
class typed_slot final : public resource_slot {
public:
    template<typename REL>
    typed_slot(R&& resource, REL&& releaser)
        : releaser_(std::forward<REL>(releaser)), resource_(std::move(resource)) {}

    R& get() noexcept { return resource_; }
    const void* address() const noexcept override { return &resource_; }

private:
    // releaser_ is built first so an allocation failure leaves the resource
    // unmoved.
    std::function<void(R&)> releaser_;
    R resource_;

    void do_release_() override { releaser_(resource_); }
};

// ==========================================================================
// owned  -- a resource transferred out of a scope
//
// Move-only. close() and move assignment release explicitly and may raise.
// Destroying a still held owned<R> releases it from a noexcept destructor,
// so a release fault at that point terminates the program.
// ==========================================================================

template<typename R>
class owned {
    friend class scope;
    std::unique_ptr<typed_slot<R>> slot_;

    explicit owned(std::unique_ptr<typed_slot<R>> s) noexcept : slot_(std::move(s)) {}

public:
    owned() noexcept = default;
    owned(owned&&) noexcept = default;
    // Releases the replaced resource after installing the new one, so a
    // release fault reaches the caller with *this already holding o's.
    owned& operator=(owned&& o) {
        if (this != &o) {
            std::unique_ptr<typed_slot<R>> old = std::move(slot_);
            slot_ = std::move(o.slot_);
            if (old) old->release_now();
        }
        return *this;
    }

    ~owned() {
        if (slot_) slot_->release_now();
    }

    explicit operator bool() const noexcept { return slot_ != nullptr; }

    R& get() {
        if (!slot_) raise(fault_kind::illegal_state, "access to an empty owned resource");
        return slot_->get();
    }
    R& operator*()  { return get(); }
    R* operator->() { return &get(); }

    void close() {
        if (!slot_) raise(fault_kind::illegal_state, "close() on an empty owned resource");
        std::unique_ptr<typed_slot<R>> s = std::move(slot_);
        s->release_now();
    }
};

// ==========================================================================
// scope  -- ordered list of acquired resources
//
// Only scoped() creates a scope. Resources are released in reverse
// acquisition order on every exit path, each exactly once.
// ==========================================================================

class scope {
    template<typename BODY, typename... HANDLERS>
    friend auto scoped(BODY&& body, HANDLERS&&... handlers);

    std::vector<std::unique_ptr<resource_slot>> slots_;

    scope() = default;

    static void record_(std::optional<fault>& primary, fault f) {
        if (primary) primary->add_suppressed(std::move(f));
        else primary.emplace(std::move(f));
    }

    // Releases everything, newest first. A release fault is suppressed into
    // primary when one exists, otherwise it becomes primary.
    void release_all_(std::optional<fault>& primary) {
        while (!slots_.empty()) {
            std::unique_ptr<resource_slot> s = std::move(slots_.back());
            slots_.pop_back();
            try {
                s->release_now();
            } catch (fault& f) {
                record_(primary, std::move(f));
            }
        }
    }

    std::vector<std::unique_ptr<resource_slot>>::iterator find_(const void* addr) {
        for (auto it = slots_.end(); it != slots_.begin();) {
            --it;
            if ((*it)->address() == addr) return it;
        }
        return slots_.end();
    }

public:
    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;

    // Default releaser calls resource.close().
    template<typename R>
    R& acquire(R resource) {
        return acquire(std::move(resource), [](R& r) { r.close(); });
    }

    template<typename R, typename REL>
    R& acquire(R resource, REL&& releaser) {
        std::unique_ptr<typed_slot<R>> slot;
        try {
            slots_.reserve(slots_.size() + 1);
            slot = std::make_unique<typed_slot<R>>(std::move(resource), releaser);
        } catch (const std::bad_alloc&) {
            releaser(resource);
            throw;
        }
        R& ref = slot->get();
        slots_.push_back(std::move(slot));
        return ref;
    }

    // Removes resource from this scope; the caller now owns its release.
    template<typename R>
    owned<R> transfer(R& resource) {
        auto it = find_(&resource);
        if (it == slots_.end())
            raise(fault_kind::illegal_argument, "transfer of a resource not held by this scope");
        auto* typed = dynamic_cast<typed_slot<R>*>(it->get());
        if (!typed)
            raise(fault_kind::illegal_argument, "transfer with a type other than the acquired one");
        it->release();
        slots_.erase(it);
        return owned<R>(std::unique_ptr<typed_slot<R>>(typed));
    }

    template<typename R>
    R& adopt(owned<R>&& o) {
        if (!o.slot_) raise(fault_kind::illegal_state, "adopt of an empty owned resource");
        slots_.reserve(slots_.size() + 1);
        R& ref = o.slot_->get();
        slots_.push_back(std::move(o.slot_));
        return ref;
    }

    size_t held() const noexcept { return slots_.size(); }
};

// ==========================================================================
// Handlers
//
// Fatal faults match no handler. The first matching handler in argument
// order wins. Its callable takes const fault& and may:
//   return a value        -- the scope resolves with it
//   throw the same fault  -- propagation continues unchanged
//   throw a new fault     -- it propagates with the original as cause
// ==========================================================================

template<typename FN>
struct fault_handler {
    enum class match : uint8_t { kind, category, any };

    match          by;
    fault_kind     kind;
    fault_category category;
    FN             fn;

    bool matches(const fault& f) const noexcept {
        if (f.is_fatal()) return false;
        switch (by) {
        case match::kind:     return f.kind() == kind;
        case match::category: return f.category() == category;
        case match::any:      return true;
        }
        return false;
    }
};

template<typename FN>
fault_handler<std::decay_t<FN>> on(fault_kind k, FN&& fn) {
    using H = fault_handler<std::decay_t<FN>>;
    return H{H::match::kind, k, category_of(k), std::forward<FN>(fn)};
}

template<typename FN>
fault_handler<std::decay_t<FN>> on(fault_category c, FN&& fn) {
    using H = fault_handler<std::decay_t<FN>>;
    return H{H::match::category, fault_kind::application, c, std::forward<FN>(fn)};
}

template<typename FN>
fault_handler<std::decay_t<FN>> on_any(FN&& fn) {
    using H = fault_handler<std::decay_t<FN>>;
    return H{H::match::any, fault_kind::application, fault_category::recoverable, std::forward<FN>(fn)};
}

template<typename RESULT, typename H>
RESULT run_handler_(H& h, const fault& original) {
    try {
        if constexpr (std::is_void_v<RESULT>) std::invoke(h.fn, original);
        else return std::invoke(h.fn, original);
    } catch (fault& raised) {
        if (raised.id() != original.id() && !raised.cause()) raised.set_cause(original);
        throw;
    } catch (...) {
        fault raised = current_fault();
        raised.set_cause(original);
        throw raised;
    }
}

template<typename RESULT>
RESULT dispatch_(fault& f) {
    throw std::move(f);
}

template<typename RESULT, typename H, typename... REST>
RESULT dispatch_(fault& f, H& h, REST&... rest) {
    if (!h.matches(f)) return dispatch_<RESULT>(f, rest...);
    return run_handler_<RESULT>(h, f);
}

// ==========================================================================
// scoped  -- run body in a fresh scope
//
//   body completes     -> release (reverse order), return its result
//   body faults        -> release, then first matching handler or re-raise
//   release faults     -> suppressed into the body's fault, or the first
//                         becomes primary when the body completed
// Non-fault exceptions from body are translated by current_fault().
// ==========================================================================

template<typename BODY, typename... HANDLERS>
auto scoped(BODY&& body, HANDLERS&&... handlers) {
    using result_type = std::invoke_result_t<BODY, scope&>;
    static_assert(!std::is_reference_v<result_type>, "scoped body must return by value");

    scope s;
    std::optional<fault> primary;

    if constexpr (std::is_void_v<result_type>) {
        try {
            std::invoke(std::forward<BODY>(body), s);
        } catch (...) {
            primary.emplace(current_fault());
        }
        s.release_all_(primary);
        if (primary) dispatch_<void>(*primary, handlers...);
    } else {
        std::optional<result_type> result;
        try {
            result.emplace(std::invoke(std::forward<BODY>(body), s));
        } catch (...) {
            primary.emplace(current_fault());
        }
        s.release_all_(primary);
        if (primary) return dispatch_<result_type>(*primary, handlers...);
        return std::move(*result);
    }
}

// ==========================================================================
// Top boundary
//
// Runs body; an unhandled fault is written with its full chain to stream.
// Returns body's int result (or 0), 1 for an unhandled fault, 2 when fatal.
// ==========================================================================

template<typename BODY>
int run_top_level(BODY&& body, std::FILE* stream = stderr) {
    try {
        if constexpr (std::is_convertible_v<std::invoke_result_t<BODY>, int>) {
            return std::invoke(std::forward<BODY>(body));
        } else {
            std::invoke(std::forward<BODY>(body));
            return 0;
        }
    } catch (...) {
        fault f = current_fault();
        report_fault(f, stream);
        return f.is_fatal() ? 2 : 1;
    }
}

} // namespace kcoll

#endif // KCOLL_SCOPE_HPP
