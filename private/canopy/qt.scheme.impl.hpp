#pragma once

#include "scheme.impl.hpp"

#include <deque>
#include <mutex>
#include <memory>

#include <QIODevice>
#include <QPointer>
#include <QWebEngineUrlRequestJob>
#include <QWebEngineUrlSchemeHandler>

#include <lockpp/lock.hpp>

namespace canopy::qt
{
    using job = std::shared_ptr<lockpp::lock<QWebEngineUrlRequestJob *>>;
    using callback = std::function<void(const std::string &, scheme::request, std::unique_ptr<scheme::responder>)>;

    // Sequential body of a streamed reply, never blocks the reader
    class stream_device : public QIODevice
    {
        mutable std::mutex m_mutex;
        std::deque<std::uint8_t> m_buffer;
        bool m_finished{false};

      public:
        stream_device(QObject *parent = nullptr);

      public:
        void push(const std::uint8_t *data, std::size_t size);
        void close_write();

      public:
        [[nodiscard]] bool isSequential() const override;
        [[nodiscard]] bool atEnd() const override;
        [[nodiscard]] qint64 bytesAvailable() const override;

      protected:
        qint64 readData(char *data, qint64 max) override;
        qint64 writeData(const char *, qint64) override;
    };

    class responder : public scheme::responder
    {
        job m_job;
        QPointer<stream_device> m_device;
        bool m_answered{false};

      public:
        explicit responder(job);

      public:
        ~responder() override;

      public:
        void respond(const scheme::response &) override;

      public:
        [[nodiscard]] bool streams() const override;

      public:
        void start(const scheme::stream_response &) override;
        void write(stash data) override;
        void finish() override;
    };

    class handler : public QWebEngineUrlSchemeHandler
    {
        std::string m_scheme;
        callback m_callback;

      public:
        handler(std::string scheme, callback, QObject *parent);

      public:
        void requestStarted(QWebEngineUrlRequestJob *) override;
    };
} // namespace canopy::qt
