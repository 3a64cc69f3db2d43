#pragma once

/**
@file
@brief Defines `util::ScopeGuard`, an utility type that executes code on scope exit.
*/

#include <type_traits>
#include <utility>

namespace util {

/// @brief A type that performs an operation on scope exit.
///
/// This type can be used to clean up C-style resources, such as libcurl handles, in a RAII-like manner.
///
/// Create a local `ScopeGuard` variable within the scope you wish to clean up with the following idiom:
///
/// ```cpp
/// CURL *easy = curl_easy_init();
/// ScopeGuard sgCleanupEasy{[&] { curl_easy_cleanup(easy); }};
/// ```
///
/// `ScopeGuard`s can be cancelled, which is useful in cases where resource cleanup is desired only in case of failure:
/// ```cpp
/// CURL *easy = curl_easy_init();
/// ScopeGuard sgCleanupEasy{[&] { curl_easy_cleanup(easy); }};
///
/// if (!Configure(easy)) {
///     return; // the handle is released here
/// }
///
/// // The handle is now owned elsewhere
/// m_easy = easy;
/// sgCleanupEasy.Cancel();
/// ```
///
/// @tparam Fn the type of the scope guard function
template <typename Fn>
class ScopeGuard {
public:
    /// @brief Creates a scope guard with the given function.
    /// @param[in] fn the function
    ScopeGuard(Fn &&fn) noexcept
        : fn(std::move(fn)) {}

    /// @brief Invokes the scope guard function if not cancelled.
    ~ScopeGuard() noexcept(noexcept(fn())) {
        if (!cancelled) {
            fn();
        }
    }

    /// @brief Cancels the scope guard.
    void Cancel() noexcept {
        cancelled = true;
    }

private:
    Fn fn;                  ///< The scope guard function
    bool cancelled = false; ///< Whether the scope guard has been cancelled
};

} // namespace util
