/**
 * @file event_store.cpp
 * @brief EventStore implementation.
 */

#include "analytics/event_store.hpp"
#include "analytics/statistics.hpp"

#include <algorithm>
#include <utility>

namespace search_analytics {

EventStore::RecordOutcome EventStore::record(Envelope envelope) {
    auto kind = envelope.kind();
    auto it = events_.find(kind);
    if (it == events_.end()) {
        events_.emplace(kind, std::move(envelope));
        return RecordOutcome::Inserted;
    }

    Envelope& current = it->second;
    if (current.payload.index() != envelope.payload.index()) {
        return RecordOutcome::Dropped;
    }
    auto merged = try_merge(std::move(current.payload), std::move(envelope.payload));
    if (!merged) return RecordOutcome::Dropped;

    current.payload = std::move(*merged);
    current.first_seen = std::min(current.first_seen, envelope.first_seen);
    current.sources.merge(envelope.sources);
    current.occurrences = saturating_add(current.occurrences, envelope.occurrences);
    return RecordOutcome::Merged;
}

const Envelope* EventStore::find(EventKind kind) const {
    auto it = events_.find(kind);
    return it == events_.end() ? nullptr : &it->second;
}

size_t EventStore::drain_and_export(IDeliverySink& sink, const InstanceUid& user_id) {
    auto events = std::exchange(events_, {});

    size_t pushed = 0;
    for (auto& [kind, envelope] : events) {
        auto result = sink.push(export_envelope(std::move(envelope), user_id));
        (void)result;
        ++pushed;
    }
    return pushed;
}

Record export_envelope(Envelope envelope, const InstanceUid& user_id) {
    auto name = event_name(envelope.kind());
    auto properties = export_payload(std::move(envelope.payload));

    if (!properties.contains("user-agent") || properties["user-agent"].is_null()) {
        properties["user-agent"] = envelope.sources;
    }
    auto& requests = properties["requests"];
    if (!requests.is_object()) {
        requests = nlohmann::json::object();
    }
    if (!requests.contains("total_received") || requests["total_received"].is_null()) {
        requests["total_received"] = envelope.occurrences;
    }

    return Record{
        .type = RecordType::Track,
        .user_id = user_id,
        .event = std::string{name},
        .properties = std::move(properties),
        .context = nlohmann::json::object(),
        .timestamp = envelope.first_seen,
    };
}

}  // namespace search_analytics
