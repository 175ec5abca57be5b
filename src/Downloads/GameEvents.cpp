#include "GameEvents.hpp"

#include "logger.hpp"

namespace downloads {

void LoggingEventEmitter::emitGameUpdate(const GameUpdateEvent& event) {
  LOG(INFO) << "[Event] " << event.eventName() << " -> "
            << storage::gameStatusName(event.status);
}

}  // namespace downloads
