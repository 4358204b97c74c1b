#pragma once

#include "chat/ChatTypes.h"
#include "core/Types.h"
#include "protocol/Message.h"
#include "race/RaceTypes.h"
#include "session/Participant.h"

#include <optional>
#include <vector>

namespace groupride::engine {

// Collaborators the engine consumes. Implementations are called from engine
// worker threads and must not block.

// The local rider's live readings, pulled at the metric rate while riding.
class MetricsSource {
public:
    virtual ~MetricsSource() = default;
    virtual std::optional<protocol::RiderMetrics> current() = 0;
};

// Completed session/chat/race history.
class HistorySink {
public:
    virtual ~HistorySink() = default;
    virtual void session_completed(const session::SessionRecord& record,
                                   const std::vector<chat::ChatEntry>& chat) = 0;
    virtual void race_completed(const race::RaceResults& results) = 0;
};

// Peer position updates for the renderer.
class RenderSink {
public:
    virtual ~RenderSink() = default;
    virtual void peer_position(const RiderId& rider, const protocol::RiderMetrics& metrics,
                               TimePoint sent_at) = 0;
};

} // namespace groupride::engine
