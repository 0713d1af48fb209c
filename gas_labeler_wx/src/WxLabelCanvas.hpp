#pragma once
#include <wx/wx.h>
#include "models/LabelInput.hpp"

namespace cv { class Mat; }
class LabelSession;

// Posted to the parent after every key the session handled; GetInt() carries the KeyOutcome
wxDECLARE_EVENT(wxEVT_LABEL_KEY_HANDLED, wxCommandEvent);

// Draws the session's rendered frame scaled to fit and turns wx mouse/keyboard input into
// session events in image coordinates.
class WxLabelCanvas : public wxPanel
{
public:
    explicit WxLabelCanvas(wxWindow* parent);

    void AttachSession(LabelSession* session);
    void RefreshView();

    // Returns false for keys the session does not bind
    bool HandleKey(const wxKeyEvent& e);

protected:
    void OnPaint(wxPaintEvent&);
    void OnSize(wxSizeEvent&);
    void OnMouseDown(wxMouseEvent&);
    void OnMouseUp(wxMouseEvent&);
    void OnMotion(wxMouseEvent&);
    void OnWheel(wxMouseEvent&);
    void OnCaptureLost(wxMouseCaptureLostEvent&);

private:
    void Forward(const PointerEvent& ev);
    wxPoint PanelToImage(const wxPoint& p) const;
    double ScaleFactor() const;          // panel pixels per image pixel
    wxPoint ImageOriginOnPanel() const;  // top-left of image in panel

    LabelSession* session_ {nullptr};
    wxBitmap bmp_;
    wxSize origImgSize_ {0,0};
    PointerButton held_ {PointerButton::None};

    wxDECLARE_EVENT_TABLE();
};

LabelKey KeyFromWx(const wxKeyEvent& e);
