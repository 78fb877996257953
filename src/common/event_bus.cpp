#include "common/event_bus.hpp"
#include "common/logger.hpp"

namespace livelink {

namespace {
auto& log() { return Logger::get("common.events"); }
}  // anonymous namespace

void EventBus::report_handler_error(const std::exception& e) {
    log().error("Event handler threw: {}", e.what());
}

} // namespace livelink
