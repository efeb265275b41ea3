#include "canopy/error.hpp"

#include <format>

#include <rebind/utils/enum.hpp>

namespace canopy
{
    error::error(errc kind, std::string message, std::int64_t code) : m_kind(kind), m_code(code), m_message(std::move(message)) {}

    errc error::kind() const
    {
        return m_kind;
    }

    std::int64_t error::code() const
    {
        return m_code;
    }

    const std::string &error::message() const
    {
        return m_message;
    }

    std::string error::what() const
    {
        const auto name = rebind::utils::find_enum_name(m_kind).value_or("unknown");

        if (m_code == 0)
        {
            return std::format("{}: {}", name, m_message);
        }

        return std::format("{} ({}): {}", name, m_code, m_message);
    }

    error error::configuration(std::string message)
    {
        return {errc::configuration, std::move(message)};
    }

    error error::engine(std::string message, std::int64_t code)
    {
        return {errc::engine, std::move(message), code};
    }

    error error::script(std::string message, std::int64_t code)
    {
        return {errc::script, std::move(message), code};
    }

    error error::protocol_handler(std::string message, std::int64_t code)
    {
        return {errc::protocol_handler, std::move(message), code};
    }

    error error::thread_affinity(std::string message)
    {
        return {errc::thread_affinity, std::move(message)};
    }
} // namespace canopy
