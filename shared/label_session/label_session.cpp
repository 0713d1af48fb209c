#include "label_session.hpp"
#include "overlay.hpp"
#include <opencv2/opencv.hpp>
#include <iostream>
#include <sstream>

LabelSession::LabelSession(const FrameStore& store, const LabelSettings& settings)
    : store_(store), settings_(settings), canvas_(settings), brush_(settings)
{
}

bool LabelSession::start()
{
    if (started_) return true;
    if (!store_.ensureOutputDirs()) return false;
    started_ = true;

    summary_.totalFrames = static_cast<int>(store_.listAllFrames().size());
    progress_ = store_.labeledIdentifiers();
    summary_.labeledAtStart = static_cast<int>(progress_.size());
    queue_ = store_.listPendingFrames();
    index_ = 0;

    std::cout << "Selected folder : " << store_.framesDir().string() << "\n"
              << "Masks output    : " << store_.masksDir().string() << "\n"
              << "Overlays output : " << store_.overlaysDir().string() << "\n"
              << "Total images    : " << summary_.totalFrames << "\n"
              << "Already labeled : " << summary_.labeledAtStart << "\n"
              << "To label        : " << queue_.size() << "\n";

    if (!loadCurrent()) std::cout << "No unlabeled images found in the selected folder.\n";
    return true;
}

bool LabelSession::isSessionComplete() const
{
    return quit_ || (started_ && index_ >= queue_.size());
}

const FrameInfo* LabelSession::currentFrame() const
{
    if (!started_ || quit_ || index_ >= queue_.size()) return nullptr;
    return &queue_[index_];
}

size_t LabelSession::remaining() const
{
    if (!started_ || quit_ || index_ >= queue_.size()) return 0;
    return queue_.size() - index_;
}

SessionSummary LabelSession::summary() const
{
    return summary_;
}

bool LabelSession::loadCurrent()
{
    while (index_ < queue_.size())
    {
        cv::Mat img;
        if (store_.loadFrame(queue_[index_], img))
        {
            canvas_.beginFrame(img);
            state_ = FrameState::Loaded;
            activeButton_ = PointerButton::None;
            return true;
        }
        std::cerr << "[LabelSession] Skipping unreadable file: " << queue_[index_].id << "\n";
        ++summary_.unreadable;
        ++index_;
    }
    canvas_.releaseFrame();
    activeButton_ = PointerButton::None;
    return false;
}

void LabelSession::advance()
{
    ++index_;
    if (!loadCurrent()) std::cout << "All images processed.\n";
}

void LabelSession::beginInteraction()
{
    if (state_ == FrameState::Loaded) state_ = FrameState::Editing;
}

bool LabelSession::handlePointerEvent(const PointerEvent& ev)
{
    if (isSessionComplete() || !canvas_.hasFrame()) return false;
    const cv::Point p(ev.x, ev.y);

    switch (ev.kind)
    {
        case PointerEvent::Wheel:
        {
            if (ev.wheelDelta == 0) return false;
            beginInteraction();
            return brush_.adjust(ev.wheelDelta > 0 ? 1 : -1, settings_);
        }
        case PointerEvent::Press:
        {
            if (ev.button == PointerButton::None) return false;
            beginInteraction();
            activeButton_ = ev.button;
            brush_.mode = (ev.button == PointerButton::Right) ? ToolMode::Erase : ToolMode::Draw;
            lastPoint_ = p;
            if (brush_.mode == ToolMode::Draw) canvas_.draw(p, p, brush_);
            else canvas_.erase(p, p, brush_);
            return true;
        }
        case PointerEvent::Move:
        {
            if (activeButton_ == PointerButton::None) return false;
            if (ev.button != activeButton_)
            {
                // Button went up outside our window; the drag is over
                activeButton_ = PointerButton::None;
                return false;
            }
            if (brush_.mode == ToolMode::Draw) canvas_.draw(lastPoint_, p, brush_);
            else canvas_.erase(lastPoint_, p, brush_);
            lastPoint_ = p;
            return true;
        }
        case PointerEvent::Release:
        {
            if (activeButton_ == PointerButton::None || ev.button != activeButton_) return false;
            activeButton_ = PointerButton::None;
            brush_.mode = ToolMode::Draw;
            return true;
        }
    }
    return false;
}

KeyOutcome LabelSession::handleKeyEvent(LabelKey key)
{
    if (key == LabelKey::None || isSessionComplete()) return KeyOutcome::Ignored;

    if (key == LabelKey::Quit)
    {
        std::cout << "Quit.\n";
        quit_ = true;
        activeButton_ = PointerButton::None;
        canvas_.releaseFrame();
        return KeyOutcome::Quit;
    }
    if (!canvas_.hasFrame()) return KeyOutcome::Ignored;

    beginInteraction();
    switch (key)
    {
        case LabelKey::Fill:
        {
            const int area = canvas_.fill();
            if (area > 0) std::cout << "Filled region (" << area << " px)\n";
            else std::cout << "No enclosed region found. Draw a closed boundary first.\n";
            return KeyOutcome::Handled;
        }
        case LabelKey::Clear:
            canvas_.clear();
            return KeyOutcome::Handled;
        case LabelKey::BrushIncrease:
            brush_.adjust(1, settings_);
            return KeyOutcome::Handled;
        case LabelKey::BrushDecrease:
            brush_.adjust(-1, settings_);
            return KeyOutcome::Handled;
        case LabelKey::Commit:
            return commit();
        case LabelKey::Skip:
            return skip();
        default:
            return KeyOutcome::Ignored;
    }
}

KeyOutcome LabelSession::commit()
{
    const FrameInfo& frame = queue_[index_];
    if (!settings_.allowEmptyCommit && !canvas_.hasRegion())
    {
        std::cout << "Nothing drawn. Draw a region before saving.\n";
        return KeyOutcome::Refused;
    }

    // The mask marks a frame as labeled, so it is written last
    if (!store_.saveOverlay(frame.id, canvas_.regionOverlay()) || !store_.saveMask(frame.id, canvas_.region()))
    {
        std::cerr << "[LabelSession::commit] " << frame.id << " not saved; frame stays open\n";
        return KeyOutcome::IoError;
    }

    std::cout << "Saved: " << frame.id << "\n";
    state_ = FrameState::Committed;
    progress_.insert(frame.id);
    ++summary_.committed;
    advance();
    return KeyOutcome::Committed;
}

KeyOutcome LabelSession::skip()
{
    std::cout << "Skipped: " << queue_[index_].id << "\n";
    state_ = FrameState::Skipped;
    ++summary_.skipped;
    advance();
    return KeyOutcome::Skipped;
}

std::string LabelSession::hudText() const
{
    const FrameInfo* frame = currentFrame();
    if (!frame) return std::string();
    std::ostringstream os;
    os << (progress_.size() + 1) << "/" << summary_.totalFrames
       << "  |  Brush: " << brush_.radius;
    if (brush_.mode == ToolMode::Erase) os << "  |  Erase";
    os << "  |  " << frame->id;
    return os.str();
}

cv::Mat LabelSession::currentRenderFrame() const
{
    if (isSessionComplete() || !canvas_.hasFrame()) return cv::Mat();
    cv::Mat display = canvas_.render();
    drawHud(display, hudText());
    return display;
}
