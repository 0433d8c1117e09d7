#include "pbu/upload/result_reconciler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pbu::upload {

ResultReconciler::ResultReconciler(events::EventBus& bus) : bus_(bus) {}

std::vector<EntryResult> ResultReconciler::reconcile(const std::vector<CommitDescriptor>& descriptors,
                                                     const std::vector<EntryOutcome>& outcomes) const {
    std::vector<EntryResult> results;
    results.reserve(descriptors.size());

    for (std::size_t index = 0; index < descriptors.size(); ++index) {
        const auto& descriptor = descriptors[index];

        EntryResult entry;
        entry.index = index;
        entry.commit_path = descriptor.path;

        if (index >= outcomes.size()) {
            entry.reason = "no outcome reported for entry";
        } else {
            const auto& outcome = outcomes[index];
            switch (outcome.kind) {
                case EntryOutcome::Kind::Success:
                    entry.success = true;
                    entry.remote_path = outcome.path_lower;
                    break;
                case EntryOutcome::Kind::Failure:
                    entry.reason = outcome.failure_reason;
                    break;
                case EntryOutcome::Kind::Other:
                    entry.reason = "unrecognized entry outcome";
                    break;
            }
        }

        if (entry.success) {
            spdlog::info("File successfully uploaded to '{}'.", entry.remote_path);
            bus_.emit(events::EntryCommittedEvent{index, entry.remote_path, descriptor.cursor.offset});
        } else {
            spdlog::error("Commit for path '{}' failed due to: {}", entry.commit_path, entry.reason);
            bus_.emit(events::EntryFailedEvent{index, entry.commit_path, entry.reason});
        }

        results.push_back(std::move(entry));
    }

    return results;
}

std::size_t ResultReconciler::count_successes(const std::vector<EntryResult>& entries) noexcept {
    return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(),
        [](const EntryResult& entry) { return entry.success; }));
}

} // namespace pbu::upload
