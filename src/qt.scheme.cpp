#include "qt.scheme.impl.hpp"

#include "log.hpp"

#include <algorithm>

#include <QMap>
#include <QUrl>
#include <QBuffer>

namespace canopy::qt
{
    static QMultiMap<QByteArray, QByteArray> convert(const std::map<std::string, std::string> &headers)
    {
        QMultiMap<QByteArray, QByteArray> rtn;

        for (const auto &[name, value] : headers)
        {
            rtn.insert(QByteArray::fromStdString(name), QByteArray::fromStdString(value));
        }

        return rtn;
    }

    static QByteArray mime_of(const std::string &mime)
    {
        return mime.empty() ? QByteArrayLiteral("application/octet-stream") : QByteArray::fromStdString(mime);
    }

    // Qt has no way to answer with a custom status, failures are reported through the job instead
    static QWebEngineUrlRequestJob::Error failure_of(int status)
    {
        using enum QWebEngineUrlRequestJob::Error;

        switch (status)
        {
        case 400:
            return UrlInvalid;
        case 401:
        case 403:
            return RequestDenied;
        case 404:
            return UrlNotFound;
        default:
            return RequestFailed;
        }
    }

    // stream_device implementation

    stream_device::stream_device(QObject *parent) : QIODevice(parent)
    {
        open(QIODevice::ReadOnly);
    }

    void stream_device::push(const std::uint8_t *data, std::size_t size)
    {
        {
            std::lock_guard lock{m_mutex};
            m_buffer.insert(m_buffer.end(), data, data + size);
        }

        QMetaObject::invokeMethod(this, &QIODevice::readyRead, Qt::QueuedConnection);
    }

    void stream_device::close_write()
    {
        {
            std::lock_guard lock{m_mutex};
            m_finished = true;
        }

        QMetaObject::invokeMethod(this, &QIODevice::readChannelFinished, Qt::QueuedConnection);
    }

    bool stream_device::isSequential() const
    {
        return true;
    }

    bool stream_device::atEnd() const
    {
        std::lock_guard lock{m_mutex};
        return m_finished && m_buffer.empty() && QIODevice::bytesAvailable() == 0;
    }

    qint64 stream_device::bytesAvailable() const
    {
        std::lock_guard lock{m_mutex};
        return static_cast<qint64>(m_buffer.size()) + QIODevice::bytesAvailable();
    }

    qint64 stream_device::readData(char *data, qint64 max)
    {
        std::lock_guard lock{m_mutex};

        if (m_buffer.empty())
        {
            return m_finished ? -1 : 0;
        }

        const auto count = std::min(static_cast<std::size_t>(max), m_buffer.size());

        std::copy_n(m_buffer.begin(), count, data);
        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(count));

        return static_cast<qint64>(count);
    }

    qint64 stream_device::writeData(const char *, qint64)
    {
        return -1;
    }

    // responder implementation

    responder::responder(job target) : m_job(std::move(target)) {}

    responder::~responder()
    {
        if (m_device)
        {
            m_device->close_write();
        }

        if (m_answered)
        {
            return;
        }

        if (auto locked = m_job->write(); locked.value())
        {
            locked.value()->fail(QWebEngineUrlRequestJob::RequestAborted);
        }
    }

    void responder::respond(const scheme::response &value)
    {
        if (std::exchange(m_answered, true))
        {
            return;
        }

        auto locked = m_job->write();
        auto *const request = locked.value();

        if (!request)
        {
            return;
        }

        if (value.status >= 400)
        {
            logger()->debug("answering {} with {}", request->requestUrl().toString().toStdString(), value.status);
            request->fail(failure_of(value.status));
            return;
        }

        auto *buffer = new QBuffer{};

        buffer->setData(reinterpret_cast<const char *>(value.data.data()), static_cast<qsizetype>(value.data.size()));
        buffer->open(QIODevice::ReadOnly);

        QObject::connect(request, &QObject::destroyed, buffer, &QObject::deleteLater);

        request->setAdditionalResponseHeaders(convert(value.headers));
        request->reply(mime_of(value.mime), buffer);
    }

    bool responder::streams() const
    {
        return true;
    }

    void responder::start(const scheme::stream_response &head)
    {
        if (std::exchange(m_answered, true))
        {
            return;
        }

        auto locked = m_job->write();
        auto *const request = locked.value();

        if (!request)
        {
            return;
        }

        if (head.status >= 400)
        {
            request->fail(failure_of(head.status));
            return;
        }

        m_device = new stream_device{request};

        request->setAdditionalResponseHeaders(convert(head.headers));
        request->reply(mime_of(head.mime), m_device);
    }

    void responder::write(stash data)
    {
        if (!m_device)
        {
            return;
        }

        m_device->push(data.data(), data.size());
    }

    void responder::finish()
    {
        if (!m_device)
        {
            return;
        }

        m_device->close_write();
        m_device.clear();
    }

    // handler implementation

    handler::handler(std::string scheme, callback value, QObject *parent)
        : QWebEngineUrlSchemeHandler(parent), m_scheme(std::move(scheme)), m_callback(std::move(value))
    {
    }

    void handler::requestStarted(QWebEngineUrlRequestJob *raw)
    {
        auto request = std::make_shared<lockpp::lock<QWebEngineUrlRequestJob *>>(raw);

        QObject::connect(raw, &QObject::destroyed, [request]() { request->assign(nullptr); });

        auto answer = std::make_unique<responder>(request);

        if (!m_callback)
        {
            return;
        }

        auto url = canopy::url::parse(raw->requestUrl().toString(QUrl::FullyEncoded).toStdString());

        if (!url)
        {
            answer->respond({.data = stash::view_str(url.error().message()), .mime = "text/plain", .status = 400});
            return;
        }

        QByteArray content;

        if (auto *const body = raw->requestBody(); body && (body->isOpen() || body->open(QIODevice::ReadOnly)))
        {
            content = body->readAll();
        }

        std::map<std::string, std::string> headers;

        for (const auto &[name, value] : raw->requestHeaders().asKeyValueRange())
        {
            headers.insert_or_assign(name.toStdString(), value.toStdString());
        }

        auto req = scheme::request{{
            .url     = std::move(url.value()),
            .method  = raw->requestMethod().toStdString(),
            .headers = std::move(headers),
            .body    = {content.begin(), content.end()},
        }};

        m_callback(m_scheme, std::move(req), std::move(answer));
    }
} // namespace canopy::qt
