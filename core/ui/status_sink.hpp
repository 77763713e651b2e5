#pragma once

#include <string>
#include <utility>

#include "window_host.hpp"

namespace tether {
namespace ui {

// Receives human-readable startup phase text. Delivery is best effort: callers
// ignore a false return and tolerate std::exception from implementations.
class IStatusSink {
public:
    virtual ~IStatusSink() = default;

    virtual bool update_status(const std::string &text) = 0;
};

// Routes status text to one window of a host (normally the splash surface)
class WindowStatusSink : public IStatusSink {
public:
    WindowStatusSink(IWindowHost &host, std::string window_id) : host_(host), window_id_(std::move(window_id)) {}

    bool update_status(const std::string &text) override { return host_.update_status_text(window_id_, text); }

private:
    IWindowHost &host_;
    std::string window_id_;
};

}  // namespace ui
}  // namespace tether
