#pragma once
#include "detection_engine.hpp"

// Consumer side of the engine: receives every ingested event and every alert.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const DeauthEvent &ev) = 0;
    virtual void on_alert(const AlertOutcome &alert) = 0;
};
