#ifndef QUIRE_HOST_KEY_EVENT_H
#define QUIRE_HOST_KEY_EVENT_H

#include "quire/selection/selection_controller.h"
#include <cstdint>
#include <string>

namespace quire {

enum class Key : std::uint32_t {
    Character = 0,
    Enter = 1,
    Backspace = 2,
    Delete = 3,
    ArrowUp = 4,
    ArrowDown = 5,
    ArrowLeft = 6,
    ArrowRight = 7,
    Escape = 8,
    Other = 9,
};

enum class KeyModifier : std::uint32_t {
    None = 0,
    Ctrl = 1 << 0,
    Meta = 1 << 1,
    Shift = 1 << 2,
};

struct KeyEvent {
    Key key = Key::Other;
    std::string text; // Key::Character only
    std::uint32_t modifiers = 0;

    bool hasModifier(KeyModifier m) const { return (modifiers & static_cast<std::uint32_t>(m)) != 0; }
    bool isShortcut() const { return hasModifier(KeyModifier::Ctrl) || hasModifier(KeyModifier::Meta); }

    // Backspace, Delete and the cut shortcut.
    bool isDeletion() const {
        if (key == Key::Backspace || key == Key::Delete) return true;
        return key == Key::Character && isShortcut() && (text == "x" || text == "X");
    }

    NavigationKey navigationKey() const {
        switch (key) {
            case Key::ArrowUp: return NavigationKey::ArrowUp;
            case Key::ArrowDown: return NavigationKey::ArrowDown;
            case Key::ArrowLeft: return NavigationKey::ArrowLeft;
            case Key::ArrowRight: return NavigationKey::ArrowRight;
            default: return NavigationKey::Other;
        }
    }

    static KeyEvent character(std::string text) {
        KeyEvent ev;
        ev.key = Key::Character;
        ev.text = std::move(text);
        return ev;
    }

    static KeyEvent of(Key key) {
        KeyEvent ev;
        ev.key = key;
        return ev;
    }
};

} // namespace quire

#endif // QUIRE_HOST_KEY_EVENT_H
