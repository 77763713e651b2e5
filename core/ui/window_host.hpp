#pragma once

#include <string>

namespace tether {
namespace ui {

constexpr const char *kSplashWindowId = "splash";
constexpr const char *kMainWindowId = "main";

// Where a window's content comes from
struct ContentSource {
    enum class Kind {
        EXTERNAL_URL,  // e.g. the backend's own UI
        LOCAL_FILE,    // Page shipped next to the shell
        BUILTIN        // Toolkit-provided page, location names it
    };

    Kind kind = Kind::EXTERNAL_URL;
    std::string location;

    static ContentSource url(const std::string &u) { return {Kind::EXTERNAL_URL, u}; }
    static ContentSource file(const std::string &p) { return {Kind::LOCAL_FILE, p}; }
    static ContentSource builtin(const std::string &name) { return {Kind::BUILTIN, name}; }
};

struct WindowOptions {
    std::string title;
    int width = 1200;
    int height = 800;
    int min_width = 800;
    int min_height = 600;
    bool visible = true;
    bool decorations = true;
};

// Windowing toolkit seam. tether only calls these; it never implements a real toolkit.
//
// Thread model:
// - create_window / show_window / close_window / process_events are called from the main thread only
// - update_status_text may be called from the readiness worker thread
//
// All methods return false when the target surface does not exist or the toolkit refused.
class IWindowHost {
public:
    virtual ~IWindowHost() = default;

    virtual bool create_window(const std::string &id, const ContentSource &source, const WindowOptions &options) = 0;
    virtual bool close_window(const std::string &id) = 0;
    virtual bool show_window(const std::string &id) = 0;
    virtual bool update_status_text(const std::string &id, const std::string &text) = 0;

    // Dispatch pending toolkit events. Called from the main thread on every tick
    // while the backend starts, so the splash stays responsive.
    virtual void process_events() {}
};

}  // namespace ui
}  // namespace tether
