#pragma once

#include "telemux/chunk/chunk.hpp"

namespace telemux::ingest {

// Receiver of complete messages (rule evaluation, persistence, ...).
// Returning false or throwing means the message was not accepted; the engine
// keeps the chunks so the message can be produced again.
class DownstreamSink {
public:
    virtual ~DownstreamSink() = default;

    virtual bool deliver(const chunk::ReassembledMessage& message) = 0;
};

}  // namespace telemux::ingest
