#pragma once

#include "status.hpp"

namespace transferq {

class Scheduler;

// Pull side of status propagation. Every call reads the scheduler's live
// state; nothing observed on the push channel is ever stored here.
class StatusEndpoint {
public:
    explicit StatusEndpoint(const Scheduler& scheduler) : scheduler_(scheduler) {}

    [[nodiscard]] StatusSnapshot getStatus() const;

private:
    const Scheduler& scheduler_;
};

} // namespace transferq
