#pragma once

#include <mutex>
#include <ostream>
#include <set>
#include <string>

#include "window_host.hpp"

namespace tether {
namespace ui {

/**
 * @brief Headless IWindowHost that publishes UI operations as JSON lines
 *
 * One object per line, e.g.
 *   {"event":"create_window","id":"splash","source":{"kind":"builtin","location":"splash"},"options":{...}}
 *   {"event":"status","id":"splash","text":"starting"}
 *
 * A desktop front-end reading the shell's stdout renders these; without one the
 * lines double as a readable trace. Safe to call from any thread.
 */
class EventStreamWindowHost : public IWindowHost {
public:
    explicit EventStreamWindowHost(std::ostream &out) : out_(out) {}

    bool create_window(const std::string &id, const ContentSource &source, const WindowOptions &options) override;
    bool close_window(const std::string &id) override;
    bool show_window(const std::string &id) override;
    bool update_status_text(const std::string &id, const std::string &text) override;

    bool has_window(const std::string &id) const;

private:
    std::ostream &out_;

    mutable std::mutex mutex_;
    std::set<std::string> windows_;
};

}  // namespace ui
}  // namespace tether
