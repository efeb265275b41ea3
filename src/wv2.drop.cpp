#include "wv2.drop.impl.hpp"

#include "log.hpp"
#include "drop.impl.hpp"

#include <utility>

#include <shellapi.h>

namespace canopy::wv2
{
    static std::vector<std::filesystem::path> paths_of(IDataObject *data)
    {
        if (!data)
        {
            return {};
        }

        FORMATETC format{CF_HDROP, nullptr, DVASPECT_CONTENT, -1, TYMED_HGLOBAL};
        STGMEDIUM medium{};

        if (FAILED(data->GetData(&format, &medium)))
        {
            return {};
        }

        std::vector<std::filesystem::path> rtn;

        if (auto *const drop = static_cast<HDROP>(GlobalLock(medium.hGlobal)); drop)
        {
            const auto count = DragQueryFileW(drop, 0xFFFFFFFF, nullptr, 0);

            for (UINT i = 0; i < count; ++i)
            {
                const auto length = DragQueryFileW(drop, i, nullptr, 0);
                std::wstring path(length, L'\0');

                DragQueryFileW(drop, i, path.data(), length + 1);
                rtn.emplace_back(std::move(path));
            }

            GlobalUnlock(medium.hGlobal);
        }

        ReleaseStgMedium(&medium);

        return drop::normalize(std::move(rtn));
    }

    drop_target::drop_target(HWND window, ComPtr<IDropTarget> original, std::function<bool(const drop_event &)> drop)
        : m_window(window), m_original(std::move(original)), m_drop(std::move(drop))
    {
    }

    HWND drop_target::window() const
    {
        return m_window;
    }

    void drop_target::restore()
    {
        m_drop = nullptr;

        if (!IsWindow(m_window))
        {
            return;
        }

        RevokeDragDrop(m_window);

        if (!m_original)
        {
            return;
        }

        if (auto status = RegisterDragDrop(m_window, m_original.Get()); FAILED(status))
        {
            logger()->warn("could not restore drop target: {:#x}", static_cast<std::uint32_t>(status));
        }
    }

    bool drop_target::raise(drop_kind kind, IDataObject *data, const POINTL *point)
    {
        if (!m_drop)
        {
            return false;
        }

        auto event = drop_event{.kind = kind, .paths = paths_of(data)};

        if (point)
        {
            POINT client{point->x, point->y};
            ScreenToClient(m_window, &client);

            event.position = canopy::point{static_cast<double>(client.x), static_cast<double>(client.y)};
        }

        return m_drop(event);
    }

    HRESULT STDMETHODCALLTYPE drop_target::DragEnter(IDataObject *data, DWORD keys, POINTL point, DWORD *effect)
    {
        m_data    = data;
        m_claimed = raise(drop_kind::hovered, data, &point);

        if (m_claimed)
        {
            *effect = DROPEFFECT_COPY;
            return S_OK;
        }

        if (!m_original)
        {
            *effect = DROPEFFECT_NONE;
            return S_OK;
        }

        return m_original->DragEnter(data, keys, point, effect);
    }

    HRESULT STDMETHODCALLTYPE drop_target::DragOver(DWORD keys, POINTL point, DWORD *effect)
    {
        const auto claimed = raise(drop_kind::hovered, m_data.Get(), &point);

        // The engine's target sees the drag only while we do not claim it
        if (claimed != m_claimed && m_original)
        {
            if (claimed)
            {
                m_original->DragLeave();
            }
            else
            {
                m_original->DragEnter(m_data.Get(), keys, point, effect);
            }
        }

        m_claimed = claimed;

        if (claimed)
        {
            *effect = DROPEFFECT_COPY;
            return S_OK;
        }

        if (!m_original)
        {
            *effect = DROPEFFECT_NONE;
            return S_OK;
        }

        return m_original->DragOver(keys, point, effect);
    }

    HRESULT STDMETHODCALLTYPE drop_target::DragLeave()
    {
        raise(drop_kind::cancelled, nullptr, nullptr);

        const auto claimed = std::exchange(m_claimed, false);
        m_data.Reset();

        if (claimed || !m_original)
        {
            return S_OK;
        }

        return m_original->DragLeave();
    }

    HRESULT STDMETHODCALLTYPE drop_target::Drop(IDataObject *data, DWORD keys, POINTL point, DWORD *effect)
    {
        const auto consumed = raise(drop_kind::dropped, data, &point);
        const auto claimed  = std::exchange(m_claimed, false);

        m_data.Reset();

        if (consumed)
        {
            if (!claimed && m_original)
            {
                m_original->DragLeave();
            }

            *effect = DROPEFFECT_COPY;
            return S_OK;
        }

        if (!m_original)
        {
            *effect = DROPEFFECT_NONE;
            return S_OK;
        }

        if (claimed)
        {
            m_original->DragEnter(data, keys, point, effect);
        }

        return m_original->Drop(data, keys, point, effect);
    }
} // namespace canopy::wv2
