#pragma once

#include "handle.hpp"

#include <utility>

#include <glib-object.h>

namespace canopy::utils
{
    // Owns one reference of a GObject, copies take another
    template <typename T>
    class g_object_ptr
    {
        T *m_data{nullptr};

      public:
        g_object_ptr() = default;
        explicit g_object_ptr(T *data) : m_data(data) {}

      public:
        g_object_ptr(const g_object_ptr &other) : m_data(other.m_data)
        {
            if (m_data)
            {
                g_object_ref(m_data);
            }
        }

        g_object_ptr(g_object_ptr &&other) noexcept : m_data(std::exchange(other.m_data, nullptr)) {}

      public:
        ~g_object_ptr()
        {
            reset();
        }

      public:
        g_object_ptr &operator=(g_object_ptr other) noexcept
        {
            std::swap(m_data, other.m_data);
            return *this;
        }

      public:
        [[nodiscard]] T *get() const
        {
            return m_data;
        }

        void reset(T *data = nullptr)
        {
            if (auto *previous = std::exchange(m_data, data); previous)
            {
                g_object_unref(previous);
            }
        }

      public:
        explicit operator bool() const
        {
            return m_data != nullptr;
        }

      public:
        // Takes an additional reference instead of adopting the caller's
        [[nodiscard]] static g_object_ptr ref(T *data)
        {
            if (data)
            {
                g_object_ref(data);
            }

            return g_object_ptr{data};
        }
    };

    using g_bytes_ptr  = handle<GBytes *, g_bytes_unref>;
    using g_error_ptr  = handle<GError *, g_error_free>;
    using g_string_ptr = handle<gchar *, g_free>;
} // namespace canopy::utils
