#pragma once

#include <utility>

// Runs a callable when the enclosing scope exits, including by exception.
// Not copyable or movable: the callable runs exactly once.
template <typename FunctionT>
class deferred {
public:
    explicit deferred(FunctionT&& function) : m_function(std::forward<FunctionT>(function)) {}

    deferred(const deferred&) = delete;
    deferred& operator=(const deferred&) = delete;

    ~deferred() {
        m_function();
    }

private:
    FunctionT m_function;
};

template <typename FunctionT>
deferred<FunctionT> make_deferred(FunctionT&& function) {
    return deferred<FunctionT>(std::forward<FunctionT>(function));
}

#define UNIQUE_VAR_NAME(prefix) UNIQUE_VAR_NAME_EXPAND(prefix, __COUNTER__)
#define UNIQUE_VAR_NAME_EXPAND(prefix, counter) UNIQUE_VAR_NAME_IMPL(prefix, counter)
#define UNIQUE_VAR_NAME_IMPL(prefix, counter) prefix##counter

// DEFER({ ... }); the block may contain commas
#define DEFER_IMPL(varname, ...) auto varname = make_deferred([&]() __VA_ARGS__)
#define DEFER(...) DEFER_IMPL(UNIQUE_VAR_NAME(deferred_holder_), __VA_ARGS__)
