#pragma once

#include <utility>

namespace canopy::utils
{
    template <typename T, auto Release, T Empty = T{}>
    class handle
    {
        T m_handle{Empty};

      public:
        handle() = default;
        explicit handle(T value) : m_handle(value) {}

      public:
        handle(const handle &) = delete;
        handle(handle &&other) noexcept : m_handle(std::exchange(other.m_handle, Empty)) {}

      public:
        ~handle()
        {
            reset();
        }

      public:
        handle &operator=(const handle &) = delete;
        handle &operator=(handle &&other) noexcept
        {
            if (this != &other)
            {
                reset(std::exchange(other.m_handle, Empty));
            }

            return *this;
        }

      public:
        [[nodiscard]] T get() const
        {
            return m_handle;
        }

        [[nodiscard]] T release()
        {
            return std::exchange(m_handle, Empty);
        }

      public:
        void reset(T value = Empty)
        {
            if (auto previous = std::exchange(m_handle, value); previous != Empty)
            {
                Release(previous);
            }
        }

      public:
        explicit operator bool() const
        {
            return m_handle != Empty;
        }
    };
} // namespace canopy::utils
