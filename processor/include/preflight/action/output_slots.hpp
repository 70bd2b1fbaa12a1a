#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace preflight {
namespace action {

// Host-owned storage for one output value. Written from the action's
// thread, read by the host; last writer wins.
template <class T>
class Variable {
public:
    void set(T value) {
        std::lock_guard<std::mutex> guard(mutex_);
        value_ = std::move(value);
        assigned_ = true;
    }

    T get() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return value_;
    }

    bool assigned() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return assigned_;
    }

private:
    mutable std::mutex mutex_;
    T value_{};
    bool assigned_ = false;
};

template <class T>
class WriteHandle {
public:
    explicit WriteHandle(std::shared_ptr<Variable<T>> target) : target_(std::move(target)) {}

    void write(T value) const {
        if (target_) {
            target_->set(std::move(value));
        }
    }

private:
    std::shared_ptr<Variable<T>> target_;
};

// An unbound slot is an empty optional
template <class T>
using Slot = std::optional<WriteHandle<T>>;

template <class T>
Slot<T> bind(std::shared_ptr<Variable<T>> variable) {
    if (!variable) {
        return std::nullopt;
    }
    return WriteHandle<T>(std::move(variable));
}

// No-op for an unbound slot; the value is only materialized when bound
template <class T, class U>
void assign(const Slot<T>& slot, U&& value) {
    if (slot) {
        slot->write(T(std::forward<U>(value)));
    }
}

struct OutputSlots {
    Slot<int32_t> status_code;
    Slot<std::string> status_message;
    Slot<std::string> response_body;
    Slot<std::string> response_headers;
    Slot<std::string> error_message;
    Slot<double> response_time_ms;
    Slot<std::string> allowed_methods;
    Slot<std::string> allowed_headers;
    Slot<std::string> max_age;
};

// Host-side variables for all nine slots
struct OutputVariables {
    std::shared_ptr<Variable<int32_t>> status_code = std::make_shared<Variable<int32_t>>();
    std::shared_ptr<Variable<std::string>> status_message = std::make_shared<Variable<std::string>>();
    std::shared_ptr<Variable<std::string>> response_body = std::make_shared<Variable<std::string>>();
    std::shared_ptr<Variable<std::string>> response_headers = std::make_shared<Variable<std::string>>();
    std::shared_ptr<Variable<std::string>> error_message = std::make_shared<Variable<std::string>>();
    std::shared_ptr<Variable<double>> response_time_ms = std::make_shared<Variable<double>>();
    std::shared_ptr<Variable<std::string>> allowed_methods = std::make_shared<Variable<std::string>>();
    std::shared_ptr<Variable<std::string>> allowed_headers = std::make_shared<Variable<std::string>>();
    std::shared_ptr<Variable<std::string>> max_age = std::make_shared<Variable<std::string>>();

    OutputSlots bind_all() const {
        OutputSlots slots;
        slots.status_code = bind(status_code);
        slots.status_message = bind(status_message);
        slots.response_body = bind(response_body);
        slots.response_headers = bind(response_headers);
        slots.error_message = bind(error_message);
        slots.response_time_ms = bind(response_time_ms);
        slots.allowed_methods = bind(allowed_methods);
        slots.allowed_headers = bind(allowed_headers);
        slots.max_age = bind(max_age);
        return slots;
    }
};

} // namespace action
} // namespace preflight
