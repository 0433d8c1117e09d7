#pragma once

#include "pbu/events/event_bus.hpp"
#include "pbu/events/events.hpp"
#include "pbu/upload/types.hpp"

#include <cstddef>
#include <vector>

namespace pbu::upload {

/**
 * @brief Maps the store's per-entry finish outcomes back onto the batch files
 *
 * outcome[i] belongs to descriptors[i]. Successes are logged at info, failures
 * at error with the store's reason verbatim. Never throws.
 */
class ResultReconciler {
public:
    explicit ResultReconciler(events::EventBus& bus);

    std::vector<EntryResult> reconcile(const std::vector<CommitDescriptor>& descriptors,
                                       const std::vector<EntryOutcome>& outcomes) const;

    static std::size_t count_successes(const std::vector<EntryResult>& entries) noexcept;

private:
    events::EventBus& bus_;
};

} // namespace pbu::upload
