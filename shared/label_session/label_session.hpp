#pragma once
#include <opencv2/core.hpp>
#include <set>
#include <string>
#include <vector>
#include "models/BrushState.hpp"
#include "models/LabelInput.hpp"
#include "models/LabelSettings.hpp"
#include "canvas_state.hpp"
#include "frame_store.hpp"

// Lifecycle of the frame currently on the canvas. Committed and Skipped are terminal for
// that frame; the session then loads the next one (back to Loaded) or completes.
enum class FrameState
{
    Loaded = 0,
    Editing = 1,
    Committed = 2,
    Skipped = 3,
};

enum class KeyOutcome
{
    Ignored = 0,  // unbound key, or session already over
    Handled,      // edit applied, same frame
    Committed,    // mask + overlay written, moved on
    Skipped,      // nothing written, moved on
    Refused,      // empty commit while allowEmptyCommit is off
    IoError,      // save failed; frame still editable, progress unchanged
    Quit,
};

struct SessionSummary
{
    int totalFrames {0};
    int labeledAtStart {0};
    int committed {0};
    int skipped {0};
    int unreadable {0};
};

/**
 * @class LabelSession
 * @brief Drives one pass over the pending frames of a folder.
 *
 * A front end feeds it pointer and key events and paints currentRenderFrame(). Everything
 * runs on the caller's thread; each event is fully handled before the call returns.
 */
class LabelSession
{
public:
    explicit LabelSession(const FrameStore& store, const LabelSettings& settings = LabelSettings());

    // Creates output folders, builds the queue and loads the first readable frame.
    // Returns false only when the output folders cannot be created.
    bool start();

    // Returns true when the view changed
    bool handlePointerEvent(const PointerEvent& ev);
    KeyOutcome handleKeyEvent(LabelKey key);

    // Composited view with HUD; empty when no frame is loaded
    cv::Mat currentRenderFrame() const;
    bool isSessionComplete() const;

    FrameState frameState() const { return state_; }
    const FrameInfo* currentFrame() const;
    const BrushState& brush() const { return brush_; }
    const CanvasState& canvas() const { return canvas_; }
    const FrameStore& store() const { return store_; }

    // Identifiers that have a mask on disk: found at start plus committed since
    const std::set<std::string>& progress() const { return progress_; }
    SessionSummary summary() const;
    std::string hudText() const;

    // Frames still to go, current one included
    size_t remaining() const;

private:
    void beginInteraction();
    bool loadCurrent();
    void advance();
    KeyOutcome commit();
    KeyOutcome skip();

    FrameStore store_;
    LabelSettings settings_;
    CanvasState canvas_;
    BrushState brush_;

    std::vector<FrameInfo> queue_;
    size_t index_ {0};
    FrameState state_ {FrameState::Loaded};
    bool started_ {false};
    bool quit_ {false};

    // Pointer drag
    PointerButton activeButton_ {PointerButton::None};
    cv::Point lastPoint_;

    std::set<std::string> progress_;
    SessionSummary summary_;
};
