#pragma once
#include <wx/wx.h>
#include <memory>
#include "models/LabelSettings.hpp"

class LabelSession;
class WxLabelCanvas;

class WxLabelFrame : public wxFrame
{
public:
    WxLabelFrame(wxWindow* parent, const wxString& framesDir, const LabelSettings& settings);
    ~WxLabelFrame() override;

    // False when the output folders could not be created
    bool StartSession();

private:
    void OnKeyHandled(wxCommandEvent&);
    void OnCharHook(wxKeyEvent&);
    void OnClose(wxCloseEvent&);
    void OnQuit(wxCommandEvent&);
    void UpdateStatus(const wxString& message = wxString());
    void LogSummary() const;

    std::unique_ptr<LabelSession> session_;
    WxLabelCanvas* canvas_ {nullptr};
    bool summaryLogged_ {false};

    wxDECLARE_EVENT_TABLE();
};
