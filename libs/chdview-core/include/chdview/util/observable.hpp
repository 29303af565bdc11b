#pragma once

/**
@file
@brief Defines `util::Observable`, a setting whose owner is told about every new value.
*/

#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace util {

/// @brief Holds a value of type `T` and calls the registered observers whenever a new value is assigned.
///
/// Observers run on the thread that assigns the value. Observers that touch state shared with other threads must
/// synchronize on their own.
///
/// @tparam T the type of the value
template <typename T>
class Observable {
public:
    /// @brief The observer function type. Small values are passed by value, larger ones by const reference.
    using Observer = std::conditional_t<sizeof(T) <= sizeof(uintptr_t), void(T), void(const T &)>;

    Observable(T value)
        : m_value(std::move(value)) {}

    Observable(const Observable &) = delete;
    Observable &operator=(const Observable &) = delete;

    /// @brief Replaces the value and passes it to every observer.
    Observable &operator=(T value) {
        m_value = std::move(value);
        for (auto &observer : m_observers) {
            observer(m_value);
        }
        return *this;
    }

    /// @brief Registers a function to be called with every new value. The current value is not reported.
    void Observe(std::function<Observer> &&observer) {
        m_observers.emplace_back(std::move(observer));
    }

    T Get() const {
        return m_value;
    }

private:
    T m_value;
    std::vector<std::function<Observer>> m_observers;
};

} // namespace util
