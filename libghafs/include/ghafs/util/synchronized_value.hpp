// Copyright (c) 2024, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef GHAFS_UTIL_SYNCHRONIZED_VALUE_HPP
#define GHAFS_UTIL_SYNCHRONIZED_VALUE_HPP

#include <concepts>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <utility>

namespace ghafs::util
{
    /// see https://en.cppreference.com/w/cpp/named_req/Mutex.html
    template <class T>
    concept Mutex = requires(T& x) {
        x.lock();
        x.unlock();
        { x.try_lock() } -> std::convertible_to<bool>;
    } and std::default_initializable<T> and (not std::movable<T>);

    /// see https://en.cppreference.com/w/cpp/named_req/SharedMutex.html
    template <class T>
    concept SharedMutex = Mutex<T> and requires(T& x) {
        x.lock_shared();
        x.unlock_shared();
    };

    /** Locks a mutex object using the most constrained sharing lock available for that mutex type.
        @returns A scoped locking object. The exact type depends on the mutex type.
    */
    template <Mutex M>
    [[nodiscard]] auto lock_as_readonly(M& mutex)
    {
        return std::unique_lock{ mutex };
    }

    template <SharedMutex M>
    [[nodiscard]] auto lock_as_readonly(M& mutex)
    {
        return std::shared_lock{ mutex };
    }

    template <Mutex M>
    [[nodiscard]] auto lock_as_exclusive(M& mutex)
    {
        return std::unique_lock{ mutex };
    }

    /** Locks a mutex for the lifetime of this type's instance and provides access to the
        associated value.

        If `readonly == true`, only non-mutable access to the associated value is provided.
    */
    template <class T, Mutex M, bool readonly>
    class [[nodiscard]] scoped_locked_ptr
    {
    public:

        using value_pointer = std::conditional_t<readonly, const T*, T*>;
        using value_reference = std::conditional_t<readonly, const T&, T&>;
        using lock_type = std::conditional_t<
            readonly,
            decltype(lock_as_readonly(std::declval<M&>())),
            decltype(lock_as_exclusive(std::declval<M&>()))>;

        static constexpr bool is_readonly = readonly;

        scoped_locked_ptr(value_reference value, M& mutex)
            : m_value(&value)
            , m_lock(mutex)
        {
        }

        scoped_locked_ptr(scoped_locked_ptr&& other) noexcept = default;
        scoped_locked_ptr& operator=(scoped_locked_ptr&& other) noexcept = default;

        scoped_locked_ptr(const scoped_locked_ptr&) = delete;
        scoped_locked_ptr& operator=(const scoped_locked_ptr&) = delete;

        [[nodiscard]] auto operator*() const -> value_reference
        {
            return *m_value;
        }

        [[nodiscard]] auto operator->() const -> value_pointer
        {
            return m_value;
        }

    private:

        value_pointer m_value;
        lock_type m_lock;
    };

    /** Thread-safe value storage.

        Holds an object which access is always implying a lock to an associated mutex.
        The only way to access the object without a lock is to copy it out with `value()`,
        which itself locks.

        If `M` is a shared mutex, read-only accesses use a shared lock so that concurrent
        readers do not block each other.

        Example:
            synchronized_value<std::map<std::string, int>> values;
            values->emplace("a", 1);             // locks for the duration of the call
            {
                auto locked = values.synchronize(); // locked until the end of the scope
                (*locked)["b"] = 2;
            }
            const auto copy = values.value();
    */
    template <std::default_initializable T, Mutex M = std::shared_mutex>
    class synchronized_value
    {
    public:

        using value_type = T;
        using mutex_type = M;
        using this_type = synchronized_value<T, M>;
        using locked_ptr = scoped_locked_ptr<T, M, false>;
        using const_locked_ptr = scoped_locked_ptr<T, M, true>;

        synchronized_value() noexcept(std::is_nothrow_default_constructible_v<T>) = default;

        explicit synchronized_value(T value)
            : m_value(std::move(value))
        {
        }

        synchronized_value(const synchronized_value& other)
            : m_value(other.value())
        {
        }

        synchronized_value& operator=(const synchronized_value& other)
        {
            if (this != &other)
            {
                auto other_value = other.value();
                auto _ = lock_as_exclusive(m_mutex);
                m_value = std::move(other_value);
            }
            return *this;
        }

        synchronized_value& operator=(T new_value)
        {
            auto _ = lock_as_exclusive(m_mutex);
            m_value = std::move(new_value);
            return *this;
        }

        /// @returns A copy of the current value, taken under a read-only lock.
        [[nodiscard]] auto value() const -> T
        {
            auto _ = lock_as_readonly(m_mutex);
            return m_value;
        }

        /// Locks the mutex exclusively for the lifetime of the returned object.
        [[nodiscard]] auto synchronize() -> locked_ptr
        {
            return locked_ptr{ m_value, m_mutex };
        }

        /// Locks the mutex in read-only mode for the lifetime of the returned object.
        [[nodiscard]] auto synchronize() const -> const_locked_ptr
        {
            return const_locked_ptr{ m_value, m_mutex };
        }

        [[nodiscard]] auto operator->() -> locked_ptr
        {
            return synchronize();
        }

        [[nodiscard]] auto operator->() const -> const_locked_ptr
        {
            return synchronize();
        }

        /** Calls the provided function with the value, under an exclusive lock.
            @returns Whatever the function returns.
        */
        template <typename Func, typename... Args>
            requires std::invocable<Func, T&, Args...>
        auto apply(Func&& func, Args&&... args)
        {
            auto _ = lock_as_exclusive(m_mutex);
            return std::invoke(std::forward<Func>(func), m_value, std::forward<Args>(args)...);
        }

        /** Calls the provided function with the value, under a read-only lock.
            @returns Whatever the function returns.
        */
        template <typename Func, typename... Args>
            requires std::invocable<Func, const T&, Args...>
        auto apply(Func&& func, Args&&... args) const
        {
            auto _ = lock_as_readonly(m_mutex);
            return std::invoke(std::forward<Func>(func), m_value, std::forward<Args>(args)...);
        }

    private:

        T m_value;
        mutable M m_mutex;
    };
}

#endif
