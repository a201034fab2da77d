#pragma once

#include <utility>

// Runs a callable when the enclosing scope unwinds.
template <typename FunctionT>
class scope_exit {
public:
    explicit scope_exit(FunctionT&& function) : m_function(std::forward<FunctionT>(function)) {}

    // Held by value from a prvalue only, so it runs exactly once
    scope_exit(const scope_exit&) = delete;
    scope_exit& operator=(const scope_exit&) = delete;
    scope_exit(scope_exit&&) = delete;
    scope_exit& operator=(scope_exit&&) = delete;

    ~scope_exit() {
        m_function();
    }

private:
    FunctionT m_function;
};

template <typename FunctionT>
auto make_scope_exit(FunctionT&& function) {
    return scope_exit<FunctionT>(std::forward<FunctionT>(function));
}

#define UNIQUE_VAR_NAME(prefix) UNIQUE_VAR_NAME_IMPL(prefix, __COUNTER__)
#define UNIQUE_VAR_NAME_IMPL(prefix, counter) UNIQUE_VAR_NAME_CONCAT(prefix, counter)
#define UNIQUE_VAR_NAME_CONCAT(prefix, counter) prefix##counter

#define DEFER_IMPL(varname, content) auto varname = make_scope_exit([&]() { content })
#define DEFER(content) DEFER_IMPL(UNIQUE_VAR_NAME(scope_exit_holder_), content)
