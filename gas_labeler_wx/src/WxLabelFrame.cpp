#include "WxLabelFrame.hpp"
#include <wx/sizer.h>
#include <iostream>
#include "WxLabelCanvas.hpp"
#include "label_session.hpp"

wxBEGIN_EVENT_TABLE(WxLabelFrame, wxFrame)
    EVT_CLOSE(WxLabelFrame::OnClose)
wxEND_EVENT_TABLE()

WxLabelFrame::WxLabelFrame(wxWindow* parent, const wxString& framesDir, const LabelSettings& settings)
    : wxFrame(parent, wxID_ANY, "Gas Labeler", wxDefaultPosition, wxSize(1200, 800))
{
    SetMinSize(wxSize(640, 480));
    // Standard IDs ensure Cmd+Q (Quit) and Cmd+H (Hide) work automatically on macOS
    auto* menuBar = new wxMenuBar();
    auto* fileMenu = new wxMenu();
#ifdef __WXMAC__
    fileMenu->Append(wxID_OSX_HIDE);
    fileMenu->Append(wxID_OSX_HIDEOTHERS);
    fileMenu->AppendSeparator();
#endif
    fileMenu->Append(wxID_EXIT);
    menuBar->Append(fileMenu, "&File");
    SetMenuBar(menuBar);
    Bind(wxEVT_MENU, &WxLabelFrame::OnQuit, this, wxID_EXIT);

    CreateStatusBar(2);
    SetStatusText("LMB draw | RMB erase | F fill | C clear | Enter/Space save | N skip | +/-/wheel brush | Q/Esc quit", 1);

    session_ = std::make_unique<LabelSession>(FrameStore(std::string(framesDir.mb_str()), settings), settings);

    auto* root = new wxBoxSizer(wxVERTICAL);
    canvas_ = new WxLabelCanvas(this);
    root->Add(canvas_, 1, wxEXPAND);
    SetSizer(root);

    Bind(wxEVT_LABEL_KEY_HANDLED, &WxLabelFrame::OnKeyHandled, this);
    Bind(wxEVT_CHAR_HOOK, &WxLabelFrame::OnCharHook, this);
}

WxLabelFrame::~WxLabelFrame() = default;

bool WxLabelFrame::StartSession()
{
    if (!session_->start()) return false;
    canvas_->AttachSession(session_.get());
    canvas_->SetFocus();
    UpdateStatus();
    if (session_->isSessionComplete())
        UpdateStatus("Nothing to label in this folder");
    return true;
}

void WxLabelFrame::OnCharHook(wxKeyEvent& e)
{
    if (!canvas_->HandleKey(e)) e.Skip();
}

void WxLabelFrame::OnKeyHandled(wxCommandEvent& ev)
{
    switch (static_cast<KeyOutcome>(ev.GetInt()))
    {
        case KeyOutcome::Quit:
            Close(true);
            return;
        case KeyOutcome::IoError:
            UpdateStatus("Save failed, see console. Frame kept open.");
            wxBell();
            return;
        case KeyOutcome::Refused:
            UpdateStatus("Nothing drawn. Draw and fill a region before saving.");
            return;
        case KeyOutcome::Committed:
        case KeyOutcome::Skipped:
            if (session_->isSessionComplete())
            {
                UpdateStatus("All images processed");
                wxMessageBox("All images processed.", "Gas Labeler", wxOK | wxICON_INFORMATION, this);
                Close(true);
                return;
            }
            break;
        default:
            break;
    }
    UpdateStatus();
}

void WxLabelFrame::UpdateStatus(const wxString& message)
{
    if (!message.IsEmpty()) { SetStatusText(message, 0); return; }
    wxString hud = wxString::FromUTF8(session_->hudText());
    if (session_->canvas().hasRegion())
        hud += wxString::Format("  |  Region: %d px", session_->canvas().regionArea());
    SetStatusText(hud, 0);
}

void WxLabelFrame::LogSummary() const
{
    if (!session_) return;
    SessionSummary s = session_->summary();
    std::cout << "\nSession summary\n"
              << "  Committed  : " << s.committed << "\n"
              << "  Skipped    : " << s.skipped << "\n"
              << "  Unreadable : " << s.unreadable << "\n"
              << "  Labeled    : " << session_->progress().size() << "/" << s.totalFrames << "\n"
              << "  Location   : " << session_->store().masksDir().parent_path().string() << "\n";
}

void WxLabelFrame::OnClose(wxCloseEvent& e)
{
    if (!summaryLogged_) { LogSummary(); summaryLogged_ = true; }
    e.Skip();
}

void WxLabelFrame::OnQuit(wxCommandEvent&)
{
    Close(true);
}
