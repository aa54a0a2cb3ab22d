/**
 * @file event_store.hpp
 * @brief At most one live envelope per event kind, drained on every flush.
 */

#pragma once

#include "analytics/delivery_sink.hpp"
#include "analytics/envelope.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <unordered_map>

namespace search_analytics {

/**
 * @brief Aggregation store.
 *
 * Only the aggregator thread touches it, so it carries no lock.
 */
class EventStore {
public:
    enum class RecordOutcome : uint8_t {
        Inserted,   ///< first envelope of its kind since the last drain
        Merged,     ///< folded into the existing envelope
        Dropped     ///< kind mismatch, existing envelope kept unchanged
    };

    /**
     * @brief Insert or merge an envelope by kind.
     *
     * Merging keeps the earliest first_seen, unions the sources and adds
     * the occurrences with saturation.
     */
    RecordOutcome record(Envelope envelope);

    /**
     * @brief Hand every envelope to the sink and start over empty.
     *
     * The map is swapped out before any export happens, so the store is
     * empty afterwards whatever the sink does. Each envelope becomes one
     * Track record for @p user_id, timestamped with its first_seen.
     * "user-agent" and "requests.total_received" are back-filled from the
     * envelope when the kind left them unset. Push failures are discarded.
     *
     * @return Number of records pushed.
     */
    size_t drain_and_export(IDeliverySink& sink, const InstanceUid& user_id);

    [[nodiscard]] size_t size() const noexcept { return events_.size(); }
    [[nodiscard]] bool empty() const noexcept { return events_.empty(); }
    [[nodiscard]] bool contains(EventKind kind) const { return events_.contains(kind); }
    [[nodiscard]] const Envelope* find(EventKind kind) const;

private:
    std::unordered_map<EventKind, Envelope> events_;
};

/**
 * @brief Turn an envelope into its exported record.
 */
[[nodiscard]] Record export_envelope(Envelope envelope, const InstanceUid& user_id);

}  // namespace search_analytics
