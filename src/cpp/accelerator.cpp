#include "accelerator.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::optional<std::string> modifier_for(const std::string& upper) {
    if (upper == "CMDORCTRL" || upper == "COMMANDORCONTROL") {
        return "<Primary>";
    }
    if (upper == "CTRL" || upper == "CONTROL") {
        return "<Control>";
    }
    if (upper == "SHIFT") {
        return "<Shift>";
    }
    if (upper == "ALT" || upper == "OPTION") {
        return "<Alt>";
    }
    if (upper == "SUPER" || upper == "CMD" || upper == "COMMAND" || upper == "META") {
        return "<Super>";
    }
    return std::nullopt;
}

// GDK key names for punctuation and named keys
std::optional<std::string> key_name_for(const std::string& key) {
    static const std::unordered_map<std::string, std::string> punctuation = {
        {"/", "slash"}, {"\\", "backslash"}, {",", "comma"}, {".", "period"},
        {"-", "minus"}, {"=", "equal"}, {";", "semicolon"}, {"'", "apostrophe"},
        {"[", "bracketleft"}, {"]", "bracketright"}, {"`", "grave"}, {"+", "plus"}
    };
    static const std::unordered_map<std::string, std::string> named = {
        {"ENTER", "Return"}, {"RETURN", "Return"}, {"ESC", "Escape"}, {"ESCAPE", "Escape"},
        {"TAB", "Tab"}, {"SPACE", "space"}, {"BACKSPACE", "BackSpace"}, {"DELETE", "Delete"},
        {"UP", "Up"}, {"DOWN", "Down"}, {"LEFT", "Left"}, {"RIGHT", "Right"},
        {"HOME", "Home"}, {"END", "End"}, {"PAGEUP", "Page_Up"}, {"PAGEDOWN", "Page_Down"},
        {"PLUS", "plus"}
    };

    if (key.size() == 1) {
        unsigned char c = static_cast<unsigned char>(key[0]);
        if (std::isalnum(c)) {
            return std::string(1, static_cast<char>(std::tolower(c)));
        }
        auto it = punctuation.find(key);
        if (it != punctuation.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string upper = to_upper(key);

    // Function keys F1..F24
    if (upper.size() <= 3 && upper[0] == 'F' &&
        std::all_of(upper.begin() + 1, upper.end(), [](unsigned char c) { return std::isdigit(c); })) {
        int n = std::stoi(upper.substr(1));
        if (n >= 1 && n <= 24) {
            return upper;
        }
        return std::nullopt;
    }

    auto it = named.find(upper);
    if (it != named.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> to_gtk_accelerator(const std::string& combo) {
    if (combo.empty()) {
        return std::nullopt;
    }

    std::string modifiers;
    size_t pos = 0;
    while (pos < combo.length()) {
        size_t plus_pos = combo.find('+', pos);

        // Last part is the key
        if (plus_pos == std::string::npos || plus_pos == combo.length() - 1) {
            auto key = key_name_for(combo.substr(pos));
            if (!key) {
                return std::nullopt;
            }
            return modifiers + *key;
        }

        auto mod = modifier_for(to_upper(combo.substr(pos, plus_pos - pos)));
        if (!mod) {
            return std::nullopt;
        }
        if (modifiers.find(*mod) == std::string::npos) {
            modifiers += *mod;
        }

        pos = plus_pos + 1;
    }

    // Combo ended with a modifier and no key
    return std::nullopt;
}

std::string escape_mnemonic(const std::string& label) {
    std::string escaped;
    escaped.reserve(label.size());
    for (char c : label) {
        if (c == '_') {
            escaped += '_';
        }
        escaped += c;
    }
    return escaped;
}
