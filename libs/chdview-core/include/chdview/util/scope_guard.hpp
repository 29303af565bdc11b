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
/// This type can be used to clean up C-style resources in a RAII-like manner or to undo temporary bookkeeping on every
/// return path of a function.
///
/// Create a local `ScopeGuard` variable within the scope you wish to clean up with the following idiom:
///
/// ```cpp
/// lzma_stream strm = LZMA_STREAM_INIT;
/// if (lzma_raw_decoder(&strm, filters) != LZMA_OK) {
///     return false;
/// }
/// ScopeGuard sgEndStream{[&] { lzma_end(&strm); }};
/// ```
///
/// `ScopeGuard`s can be cancelled, which is useful in cases where cleanup is desired only in case of failure:
///
/// ```cpp
/// ScopeGuard sgInvalidate{[&] { image.Invalidate(); }};
/// if (!ReadHeader()) {
///     return false;
/// }
/// if (!ReadMap()) {
///     return false;
/// }
/// sgInvalidate.Cancel();
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

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;

    /// @brief Cancels the scope guard.
    void Cancel() noexcept {
        cancelled = true;
    }

private:
    Fn fn;                  ///< The scope guard function
    bool cancelled = false; ///< Whether the scope guard has been cancelled
};

} // namespace util
