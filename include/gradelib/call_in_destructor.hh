#pragma once

#include <utility>

// Calls @p func on scope exit unless cancel()ed. @p func has to be noexcept.
template <class Func>
class CallInDtor {
    Func func_;
    bool armed_ = true;

public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    CallInDtor(Func func) : func_(std::move(func)) {}

    CallInDtor(const CallInDtor&) = delete;
    CallInDtor& operator=(const CallInDtor&) = delete;
    CallInDtor(CallInDtor&&) = delete;
    CallInDtor& operator=(CallInDtor&&) = delete;

    void cancel() noexcept { armed_ = false; }

    ~CallInDtor() {
        if (armed_) {
            func_();
        }
    }
};
