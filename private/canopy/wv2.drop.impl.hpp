#pragma once

#include <canopy/drop.hpp>

#include <functional>

#include <wrl.h>
#include <oleidl.h>

namespace canopy::wv2
{
    using Microsoft::WRL::ComPtr;

    // Sits in front of the drop target the engine registered on one of its windows
    class drop_target : public Microsoft::WRL::RuntimeClass<Microsoft::WRL::RuntimeClassFlags<Microsoft::WRL::ClassicCom>, IDropTarget>
    {
        HWND m_window;
        ComPtr<IDropTarget> m_original;
        std::function<bool(const drop_event &)> m_drop;

      private:
        ComPtr<IDataObject> m_data;
        bool m_claimed{false};

      public:
        drop_target(HWND window, ComPtr<IDropTarget> original, std::function<bool(const drop_event &)> drop);

      public:
        [[nodiscard]] HWND window() const;

      public:
        // Hands the window back to the engine's own drop target
        void restore();

      public:
        HRESULT STDMETHODCALLTYPE DragEnter(IDataObject *data, DWORD keys, POINTL point, DWORD *effect) override;
        HRESULT STDMETHODCALLTYPE DragOver(DWORD keys, POINTL point, DWORD *effect) override;
        HRESULT STDMETHODCALLTYPE DragLeave() override;
        HRESULT STDMETHODCALLTYPE Drop(IDataObject *data, DWORD keys, POINTL point, DWORD *effect) override;

      private:
        bool raise(drop_kind, IDataObject *, const POINTL *);
    };
} // namespace canopy::wv2
