// Reports labeling progress for a frames folder without opening a window.
// Build via CMake target: label_status_cli

#include <iostream>
#include <string>
#include "frame_store.hpp"
#include "models/LabelSettings.hpp"

int main(int argc, char** argv)
{
    std::string folder;
    bool listPending = false;
    LabelSettings settings;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list") listPending = true;
        else if (arg == "--masks-dir" && i + 1 < argc) settings.masksDirName = argv[++i];
        else if (arg == "--overlays-dir" && i + 1 < argc) settings.overlaysDirName = argv[++i];
        else if (folder.empty() && !arg.empty() && arg[0] != '-') folder = arg;
        else { std::cerr << "Unknown argument: " << arg << "\n"; folder.clear(); break; }
    }
    if (folder.empty()) {
        std::cerr << "Usage: " << argv[0] << " <frames_folder> [--list] [--masks-dir name] [--overlays-dir name]\n";
        return 1;
    }

    FrameStore store(folder, settings);
    const auto all = store.listAllFrames();
    if (all.empty()) {
        std::cerr << "No supported images found in: " << folder << "\n";
        return 1;
    }
    const auto labeled = store.labeledIdentifiers();
    const auto pending = store.listPendingFrames();

    std::cout << "Selected folder : " << store.framesDir().string() << "\n"
              << "Masks output    : " << store.masksDir().string() << "\n"
              << "Overlays output : " << store.overlaysDir().string() << "\n"
              << "Total images    : " << all.size() << "\n"
              << "Already labeled : " << labeled.size() << "\n"
              << "To label        : " << pending.size() << "\n";
    if (listPending)
        for (const auto& f : pending) std::cout << "  " << f.id << "\n";
    return 0;
}
