#ifndef KCOLL_FAULT_HPP
#define KCOLL_FAULT_HPP

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace kcoll {

// ==========================================================================
// Fault kinds and categories
//
// A fault is classified by kind; the category is a pure function of the
// kind and drives handler matching:
//   recoverable -- callers are expected to handle or declare it
//   defect      -- a logic error; propagates to an explicit handler or the top
//   fatal       -- never intercepted by kind/category handlers
// ==========================================================================

enum class fault_category : uint8_t {
    recoverable,
    defect,
    fatal,
};

enum class fault_kind : uint8_t {
    // recoverable
    not_found,
    duplicate_key,
    capacity_overflow,
    no_such_element,
    illegal_argument,
    resource_close,
    application,
    // defect
    concurrent_modification,
    comparator_contract,
    index_out_of_range,
    illegal_state,
    external,
    // fatal
    resource_exhausted,
};

constexpr fault_category category_of(fault_kind k) noexcept {
    switch (k) {
    case fault_kind::not_found:
    case fault_kind::duplicate_key:
    case fault_kind::capacity_overflow:
    case fault_kind::no_such_element:
    case fault_kind::illegal_argument:
    case fault_kind::resource_close:
    case fault_kind::application:
        return fault_category::recoverable;
    case fault_kind::resource_exhausted:
        return fault_category::fatal;
    default:
        return fault_category::defect;
    }
}

constexpr const char* kind_name(fault_kind k) noexcept {
    switch (k) {
    case fault_kind::not_found:               return "not_found";
    case fault_kind::duplicate_key:           return "duplicate_key";
    case fault_kind::capacity_overflow:       return "capacity_overflow";
    case fault_kind::no_such_element:         return "no_such_element";
    case fault_kind::illegal_argument:        return "illegal_argument";
    case fault_kind::resource_close:          return "resource_close";
    case fault_kind::application:             return "application";
    case fault_kind::concurrent_modification: return "concurrent_modification";
    case fault_kind::comparator_contract:     return "comparator_contract";
    case fault_kind::index_out_of_range:      return "index_out_of_range";
    case fault_kind::illegal_state:           return "illegal_state";
    case fault_kind::external:                return "external";
    case fault_kind::resource_exhausted:      return "resource_exhausted";
    }
    return "unknown";
}

constexpr const char* category_name(fault_category c) noexcept {
    switch (c) {
    case fault_category::recoverable: return "recoverable";
    case fault_category::defect:      return "defect";
    case fault_category::fatal:       return "fatal";
    }
    return "unknown";
}

// ==========================================================================
// fault
//
// The single exception type thrown by kcoll. Carries a kind, a message, at
// most one cause and any number of suppressed faults. Copies share an
// identity, so a handler re-raising the fault it was given can be told apart
// from one raising a new fault.
// ==========================================================================

class fault : public std::exception {
public:
    fault(fault_kind kind, std::string message)
        : kind_(kind), id_(next_id_()), message_(std::move(message)) {}

    fault(fault_kind kind, std::string message, fault cause)
        : fault(kind, std::move(message)) {
        set_cause(std::move(cause));
    }

    const char* what() const noexcept override { return message_.c_str(); }

    fault_kind     kind()     const noexcept { return kind_; }
    fault_category category() const noexcept { return category_of(kind_); }
    bool is_fatal() const noexcept { return category() == fault_category::fatal; }

    const std::string& message() const noexcept { return message_; }
    uint64_t id() const noexcept { return id_; }

    // Null when the fault has no cause.
    const fault* cause() const noexcept { return cause_.get(); }

    void set_cause(fault cause) {
        cause_ = std::make_shared<const fault>(std::move(cause));
    }

    const std::vector<fault>& suppressed() const noexcept { return suppressed_; }

    void add_suppressed(fault f) { suppressed_.push_back(std::move(f)); }

    // Multi-line rendering of the fault, its suppressed list and cause chain.
    std::string describe() const {
        std::string out;
        describe_(out, 0, "");
        return out;
    }

private:
    fault_kind kind_;
    uint64_t id_;
    std::string message_;
    std::shared_ptr<const fault> cause_;
    std::vector<fault> suppressed_;

    static uint64_t next_id_() noexcept {
        static std::atomic<uint64_t> counter{0};
        return counter.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    void describe_(std::string& out, int depth, const char* prefix) const {
        out.append(static_cast<size_t>(depth) * 2, ' ');
        out += prefix;
        out += "fault[";
        out += category_name(category());
        out += '/';
        out += kind_name(kind_);
        out += "]: ";
        out += message_;
        out += '\n';
        for (const fault& s : suppressed_)
            s.describe_(out, depth + 1, "suppressed: ");
        if (cause_)
            cause_->describe_(out, depth + 1, "caused by: ");
    }
};

// ==========================================================================
// Raising helpers
// ==========================================================================

[[noreturn]] inline void raise(fault_kind kind, std::string message) {
    throw fault(kind, std::move(message));
}

[[noreturn]] inline void raise_index_(size_t index, size_t size) {
    raise(fault_kind::index_out_of_range,
          "index " + std::to_string(index) + " out of range for size " + std::to_string(size));
}

inline void report_fault(const fault& f, std::FILE* stream = stderr) {
    std::fprintf(stream, "unhandled %s", f.describe().c_str());
    std::fflush(stream);
}

} // namespace kcoll

#endif // KCOLL_FAULT_HPP
