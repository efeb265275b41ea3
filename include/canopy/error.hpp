#pragma once

#include <string>
#include <cstdint>
#include <expected>

namespace canopy
{
    enum class errc : std::uint8_t
    {
        configuration,
        engine,
        script,
        protocol_handler,
        thread_affinity,
    };

    class error
    {
        errc m_kind;
        std::int64_t m_code;
        std::string m_message;

      public:
        error(errc kind, std::string message, std::int64_t code = 0);

      public:
        [[nodiscard]] errc kind() const;
        [[nodiscard]] std::int64_t code() const;
        [[nodiscard]] const std::string &message() const;

      public:
        [[nodiscard]] std::string what() const;

      public:
        [[nodiscard]] static error configuration(std::string message);
        [[nodiscard]] static error engine(std::string message, std::int64_t code = 0);
        [[nodiscard]] static error script(std::string message, std::int64_t code = 0);
        [[nodiscard]] static error protocol_handler(std::string message, std::int64_t code = 0);
        [[nodiscard]] static error thread_affinity(std::string message);
    };

    template <typename T = void>
    using result = std::expected<T, error>;

    using unexpected = std::unexpected<error>;
} // namespace canopy
