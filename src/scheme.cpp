#include "scheme.impl.hpp"

namespace canopy::scheme
{
    // request implementation

    request::request(impl data) : m_impl(std::make_unique<impl>(std::move(data))) {}

    request::request(const request &other) : request(*other.m_impl) {}

    request::request(request &&) noexcept = default;

    request::~request() = default;

    url request::url() const
    {
        return m_impl->url;
    }

    std::string request::method() const
    {
        return m_impl->method;
    }

    stash request::content() const
    {
        return stash::view(m_impl->body);
    }

    std::map<std::string, std::string> request::headers() const
    {
        return m_impl->headers;
    }

    // executor implementation

    executor::impl::~impl()
    {
        if (slot)
        {
            slot->abandon();
        }
    }

    executor::executor(std::shared_ptr<impl> impl) : m_impl(std::move(impl)) {}
    executor::executor(const executor &) = default;
    executor::executor(executor &&) noexcept = default;
    executor::~executor() = default;

    void executor::resolve(const response &response) const
    {
        if (m_impl && m_impl->slot)
        {
            m_impl->slot->resolve(response);
        }
    }

    void executor::reject(error err) const
    {
        if (m_impl && m_impl->slot)
        {
            m_impl->slot->reject(err);
        }
    }

    void executor::start(const stream_response &response) const
    {
        if (m_impl && m_impl->slot)
        {
            m_impl->slot->start(response);
        }
    }

    void executor::write(stash data) const
    {
        if (m_impl && m_impl->slot)
        {
            m_impl->slot->write(std::move(data));
        }
    }

    void executor::finish() const
    {
        if (m_impl && m_impl->slot)
        {
            m_impl->slot->finish();
        }
    }

    bool executor::valid() const
    {
        return m_impl && m_impl->slot && m_impl->slot->valid();
    }
} // namespace canopy::scheme
