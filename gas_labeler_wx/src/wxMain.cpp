#include <wx/wx.h>
#include <wx/cmdline.h>
#include <wx/dirdlg.h>
#include <wx/dir.h>
#include <wx/display.h>
#include <algorithm>
#include <iostream>
#include <string>
#include "WxLabelFrame.hpp"
#include "frame_store.hpp"
#include "models/LabelSettings.hpp"

class GasLabelerApp : public wxApp
{
public:
    void OnInitCmdLine(wxCmdLineParser& parser) override
    {
        wxApp::OnInitCmdLine(parser);
        parser.AddOption("f", "folder", "folder containing the images to label");
        parser.AddOption("b", "brush", "initial brush radius (1-20)", wxCMD_LINE_VAL_NUMBER);
        parser.AddOption("a", "alpha", "overlay opacity (0-1)", wxCMD_LINE_VAL_DOUBLE);
        parser.AddOption("", "feather", "overlay edge softening radius, 0 = hard edge", wxCMD_LINE_VAL_NUMBER);
        parser.AddOption("", "color", "overlay color as #RRGGBB");
        parser.AddSwitch("", "require-region", "refuse to save a frame with an empty mask");
        parser.AddSwitch("", "include-stroke", "count the drawn boundary as part of the region");
    }

    bool OnCmdLineParsed(wxCmdLineParser& parser) override
    {
        if (!wxApp::OnCmdLineParsed(parser)) return false;
        parser.Found("folder", &folder_);
        long v = 0;
        if (parser.Found("brush", &v)) settings_.brushDefault = int(v);
        if (parser.Found("feather", &v)) settings_.featherRadius = std::max(0, int(v));
        double a = 0.0;
        if (parser.Found("alpha", &a)) settings_.overlayAlpha = std::clamp(a, 0.0, 1.0);
        wxString hex;
        if (parser.Found("color", &hex))
        {
            wxColour c(hex);
            if (!c.IsOk()) { wxLogError("Invalid --color value: %s", hex); return false; }
            settings_.overlayR = c.Red(); settings_.overlayG = c.Green(); settings_.overlayB = c.Blue();
        }
        if (parser.Found("require-region")) settings_.allowEmptyCommit = false;
        if (parser.Found("include-stroke")) settings_.fillIncludesStroke = true;
        return true;
    }

    bool OnInit() override
    {
        if (!wxApp::OnInit()) return false;
        wxInitAllImageHandlers();

        if (folder_.IsEmpty())
        {
            wxDirDialog dlg(nullptr, "Select folder containing images to label", wxEmptyString,
                            wxDD_DEFAULT_STYLE | wxDD_DIR_MUST_EXIST);
            if (dlg.ShowModal() != wxID_OK) { std::cout << "No folder selected. Exiting.\n"; return false; }
            folder_ = dlg.GetPath();
        }
        if (!wxDir::Exists(folder_))
        {
            wxMessageBox("Folder not found:\n" + folder_, "Gas Labeler", wxOK | wxICON_ERROR);
            return false;
        }

        FrameStore probe(std::string(folder_.mb_str()), settings_);
        if (probe.listAllFrames().empty())
        {
            wxMessageBox("No supported images found in:\n" + folder_ +
                         "\n\nSupported formats: .jpg, .jpeg, .png, .bmp, .webp",
                         "No Images Found", wxOK | wxICON_WARNING);
            std::cout << "No images found in: " << folder_.mb_str() << "\n";
            return false;
        }

        WxLabelFrame* frame = new WxLabelFrame(nullptr, folder_, settings_);
        if (!frame->StartSession())
        {
            wxMessageBox("Cannot create the masks/overlays folders next to:\n" + folder_, "Gas Labeler", wxOK | wxICON_ERROR);
            frame->Destroy();
            return false;
        }

        if (wxDisplay::GetCount() > 0) {
            wxDisplay d(0u);
            wxRect ar = d.GetClientArea();
            frame->SetSize(std::min(1200, ar.GetWidth()), std::min(800, ar.GetHeight()));
            frame->Centre();
        }
        frame->Raise();
        frame->Show(true);
        return true;
    }

private:
    wxString folder_;
    LabelSettings settings_;
};

wxIMPLEMENT_APP(GasLabelerApp);
