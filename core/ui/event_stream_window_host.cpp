#include "event_stream_window_host.hpp"

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"

namespace tether {
namespace ui {

namespace {

const char *kind_to_string(ContentSource::Kind kind) {
    switch (kind) {
        case ContentSource::Kind::EXTERNAL_URL:
            return "url";
        case ContentSource::Kind::LOCAL_FILE:
            return "file";
        case ContentSource::Kind::BUILTIN:
            return "builtin";
    }
    return "unknown";
}

void write_line(std::ostream &out, const nlohmann::json &event) { out << event.dump() << std::endl; }

}  // namespace

void to_json(nlohmann::json &j, const ContentSource &source) {
    j = nlohmann::json{{"kind", kind_to_string(source.kind)}, {"location", source.location}};
}

void to_json(nlohmann::json &j, const WindowOptions &options) {
    j = nlohmann::json{{"title", options.title},
                       {"width", options.width},
                       {"height", options.height},
                       {"min_width", options.min_width},
                       {"min_height", options.min_height},
                       {"visible", options.visible},
                       {"decorations", options.decorations}};
}

bool EventStreamWindowHost::create_window(const std::string &id, const ContentSource &source,
                                          const WindowOptions &options) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!windows_.insert(id).second) {
        LOG_WARN("[UI] Window '" << id << "' already exists");
        return false;
    }

    write_line(out_, {{"event", "create_window"}, {"id", id}, {"source", source}, {"options", options}});
    return true;
}

bool EventStreamWindowHost::close_window(const std::string &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (windows_.erase(id) == 0) {
        return false;
    }

    write_line(out_, {{"event", "close_window"}, {"id", id}});
    return true;
}

bool EventStreamWindowHost::show_window(const std::string &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (windows_.count(id) == 0) {
        return false;
    }

    write_line(out_, {{"event", "show_window"}, {"id", id}});
    return true;
}

bool EventStreamWindowHost::update_status_text(const std::string &id, const std::string &text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (windows_.count(id) == 0) {
        return false;
    }

    write_line(out_, {{"event", "status"}, {"id", id}, {"text", text}});
    return true;
}

bool EventStreamWindowHost::has_window(const std::string &id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.count(id) > 0;
}

}  // namespace ui
}  // namespace tether
