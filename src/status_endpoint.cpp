#include "transferq/status_endpoint.hpp"

#include "transferq/scheduler.hpp"

namespace transferq {

StatusSnapshot StatusEndpoint::getStatus() const {
    return scheduler_.snapshot();
}

} // namespace transferq
