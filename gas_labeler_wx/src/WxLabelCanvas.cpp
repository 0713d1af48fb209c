#include "WxLabelCanvas.hpp"
#include <wx/dcbuffer.h>
#include <wx/image.h>
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include "label_session.hpp"
#include "util/ImageOps.hpp"

wxDEFINE_EVENT(wxEVT_LABEL_KEY_HANDLED, wxCommandEvent);

wxBEGIN_EVENT_TABLE(WxLabelCanvas, wxPanel)
    EVT_PAINT(WxLabelCanvas::OnPaint)
    EVT_SIZE(WxLabelCanvas::OnSize)
    EVT_LEFT_DOWN(WxLabelCanvas::OnMouseDown)
    EVT_RIGHT_DOWN(WxLabelCanvas::OnMouseDown)
    EVT_LEFT_UP(WxLabelCanvas::OnMouseUp)
    EVT_RIGHT_UP(WxLabelCanvas::OnMouseUp)
    EVT_MOTION(WxLabelCanvas::OnMotion)
    EVT_MOUSEWHEEL(WxLabelCanvas::OnWheel)
    EVT_MOUSE_CAPTURE_LOST(WxLabelCanvas::OnCaptureLost)
wxEND_EVENT_TABLE()

LabelKey KeyFromWx(const wxKeyEvent& e)
{
    switch (e.GetKeyCode())
    {
        case WXK_RETURN: case WXK_NUMPAD_ENTER: case WXK_SPACE: return LabelKey::Commit;
        case WXK_ESCAPE: return LabelKey::Quit;
        case WXK_NUMPAD_ADD: return LabelKey::BrushIncrease;
        case WXK_NUMPAD_SUBTRACT: return LabelKey::BrushDecrease;
        default: break;
    }
    int code = e.GetKeyCode();
    if (code > 0 && code < 128) return labelKeyFromChar(code);
    return LabelKey::None;
}

WxLabelCanvas::WxLabelCanvas(wxWindow* parent) : wxPanel(parent, wxID_ANY, wxDefaultPosition, wxDefaultSize, wxWANTS_CHARS)
{
    SetBackgroundStyle(wxBG_STYLE_PAINT);
    SetCursor(wxCURSOR_CROSS);
}

void WxLabelCanvas::AttachSession(LabelSession* session)
{
    session_ = session;
    RefreshView();
}

void WxLabelCanvas::RefreshView()
{
    cv::Mat view = session_ ? session_->currentRenderFrame() : cv::Mat();
    if (view.empty())
    {
        bmp_ = wxBitmap();
        origImgSize_ = wxSize(0, 0);
        Refresh();
        return;
    }

    // Fit into the client area, keeping aspect
    wxSize client = GetClientSize();
    double sx = double(std::max(1, client.x)) / std::max(1, view.cols);
    double sy = double(std::max(1, client.y)) / std::max(1, view.rows);
    double s = std::min(sx, sy);
    int nw = std::max(1, int(view.cols * s));
    int nh = std::max(1, int(view.rows * s));
    cv::Mat resized;
    cv::resize(view, resized, cv::Size(nw, nh), 0, 0, s < 1.0 ? cv::INTER_AREA : cv::INTER_NEAREST);

    cv::Mat rgb; cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    const size_t size = static_cast<size_t>(rgb.cols) * static_cast<size_t>(rgb.rows) * 3;
    unsigned char* buf = static_cast<unsigned char*>(malloc(size));
    std::memcpy(buf, rgb.data, size);
    wxImage wi(rgb.cols, rgb.rows, buf, false /*wxImage owns and frees buf*/);
    bmp_ = wxBitmap(wi);
    origImgSize_ = wxSize(view.cols, view.rows);
    Refresh();
}

void WxLabelCanvas::OnPaint(wxPaintEvent&)
{
    wxAutoBufferedPaintDC dc(this);
    dc.SetBackground(wxBrush(wxColour(26, 29, 33)));
    dc.Clear();
    if (!bmp_.IsOk())
    {
        dc.SetTextForeground(wxColour(153, 153, 153));
        dc.DrawLabel("No image loaded", wxRect(wxPoint(0,0), GetClientSize()), wxALIGN_CENTER);
        return;
    }
    dc.DrawBitmap(bmp_, ImageOriginOnPanel());
}

void WxLabelCanvas::OnSize(wxSizeEvent& event)
{
    RefreshView();
    event.Skip();
}

void WxLabelCanvas::OnMouseDown(wxMouseEvent& e)
{
    SetFocus();
    if (!HasCapture()) CaptureMouse();
    held_ = e.RightDown() ? PointerButton::Right : PointerButton::Left;
    wxPoint p = PanelToImage(e.GetPosition());
    Forward(PointerEvent::press(held_, p.x, p.y));
}

void WxLabelCanvas::OnMouseUp(wxMouseEvent& e)
{
    if (HasCapture()) ReleaseMouse();
    PointerButton b = e.RightUp() ? PointerButton::Right : PointerButton::Left;
    wxPoint p = PanelToImage(e.GetPosition());
    if (b == held_) held_ = PointerButton::None;
    Forward(PointerEvent::release(b, p.x, p.y));
}

void WxLabelCanvas::OnMotion(wxMouseEvent& e)
{
    if (held_ == PointerButton::None) return;
    PointerButton b = e.LeftIsDown() ? PointerButton::Left : (e.RightIsDown() ? PointerButton::Right : PointerButton::None);
    wxPoint p = PanelToImage(e.GetPosition());
    Forward(PointerEvent::move(b, p.x, p.y));
    if (b == PointerButton::None) held_ = PointerButton::None;
}

void WxLabelCanvas::OnWheel(wxMouseEvent& e)
{
    Forward(PointerEvent::wheel(e.GetWheelRotation()));
}

void WxLabelCanvas::OnCaptureLost(wxMouseCaptureLostEvent&)
{
    if (held_ == PointerButton::None) return;
    Forward(PointerEvent::release(held_, 0, 0));
    held_ = PointerButton::None;
}

void WxLabelCanvas::Forward(const PointerEvent& ev)
{
    if (!session_) return;
    if (session_->handlePointerEvent(ev)) RefreshView();
}

bool WxLabelCanvas::HandleKey(const wxKeyEvent& e)
{
    if (!session_) return false;
    LabelKey key = KeyFromWx(e);
    if (key == LabelKey::None) return false;
    KeyOutcome outcome = session_->handleKeyEvent(key);
    RefreshView();
    wxCommandEvent ev(wxEVT_LABEL_KEY_HANDLED);
    ev.SetInt(static_cast<int>(outcome));
    wxPostEvent(GetParent(), ev);
    return true;
}

wxPoint WxLabelCanvas::PanelToImage(const wxPoint& p) const
{
    wxPoint o = ImageOriginOnPanel();
    // Session clips to the frame, no clamping here
    cv::Point q = util::viewToImage(cv::Point(p.x, p.y), cv::Point(o.x, o.y), ScaleFactor());
    return wxPoint(q.x, q.y);
}

double WxLabelCanvas::ScaleFactor() const
{
    if (!bmp_.IsOk() || origImgSize_.GetWidth() <= 0 || origImgSize_.GetHeight() <= 0) return 1.0;
    double sx = double(bmp_.GetWidth()) / double(origImgSize_.GetWidth());
    double sy = double(bmp_.GetHeight()) / double(origImgSize_.GetHeight());
    return std::min(sx, sy);
}

wxPoint WxLabelCanvas::ImageOriginOnPanel() const
{
    // Center the bitmap within panel
    wxSize cs = GetClientSize();
    int x = (cs.x - bmp_.GetWidth())/2; if (x < 0) x = 0;
    int y = (cs.y - bmp_.GetHeight())/2; if (y < 0) y = 0;
    return wxPoint(x,y);
}
