/**
 * @file LabelInput.hpp
 * Toolkit-neutral input events fed to the labeling session by a front end.
 */
#pragma once

enum class PointerButton
{
    None = 0,
    Left = 1,   // draw
    Right = 2,  // erase
};

struct PointerEvent
{
    enum Kind { Press, Move, Release, Wheel };

    Kind kind {Move};
    PointerButton button {PointerButton::None};
    int x {0};          // image space
    int y {0};
    int wheelDelta {0}; // only the sign is used

    static PointerEvent press(PointerButton b, int x, int y) { return { Press, b, x, y, 0 }; }
    static PointerEvent move(PointerButton b, int x, int y) { return { Move, b, x, y, 0 }; }
    static PointerEvent release(PointerButton b, int x, int y) { return { Release, b, x, y, 0 }; }
    static PointerEvent wheel(int delta) { return { Wheel, PointerButton::None, 0, 0, delta }; }
};

enum class LabelKey
{
    None = 0,
    Fill,
    Commit,
    Skip,
    Clear,
    Quit,
    BrushIncrease,
    BrushDecrease,
};

// Maps the classic keyboard bindings (f, Enter/Space, n, c, q/Esc, +/=, -) to a LabelKey.
inline LabelKey labelKeyFromChar(int key)
{
    switch (key)
    {
        case 'f': case 'F': return LabelKey::Fill;
        case 13: case 10: case ' ': return LabelKey::Commit;
        case 'n': case 'N': return LabelKey::Skip;
        case 'c': case 'C': return LabelKey::Clear;
        case 'q': case 'Q': case 27: return LabelKey::Quit;
        case '+': case '=': return LabelKey::BrushIncrease;
        case '-': case '_': return LabelKey::BrushDecrease;
        default: return LabelKey::None;
    }
}
