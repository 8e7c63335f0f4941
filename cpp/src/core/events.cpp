#include "ferry/core/events.hpp"

#include <algorithm>
#include <exception>

#include "ferry/core/log.hpp"

namespace ferry::core {
    const char* upload_event_name(UploadEventType type) noexcept {
        switch (type) {
            case UploadEventType::Created: return "created";
            case UploadEventType::Progress: return "progress";
            case UploadEventType::Finalized: return "finalized";
            case UploadEventType::Cancelled: return "cancelled";
            case UploadEventType::Failed: return "failed";
            case UploadEventType::Expired: return "expired";
        }
        return "unknown";
    }

    SubscriptionId EventBus::subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        const SubscriptionId id{next_id_++};
        handlers_.emplace_back(id, std::move(handler));
        return id;
    }

    void EventBus::unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(),
                            [id](const auto& entry) { return entry.first == id; }),
            handlers_.end());
    }

    void EventBus::publish(const UploadEvent& event) const noexcept {
        std::vector<std::pair<SubscriptionId, Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = handlers_;
        }
        for (const auto& entry : snapshot) {
            if (!entry.second) {
                continue;
            }
            // A failing subscriber must not break delivery to the others.
            try {
                entry.second(event);
            } catch (const std::exception& e) {
                log_error("event subscriber %llu threw on %s: %s",
                    static_cast<unsigned long long>(entry.first.v), upload_event_name(event.type), e.what());
            }
        }
    }

    std::size_t EventBus::subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

    SubscriptionId attach_indexing_sink(EventBus& bus, IndexingSink& sink) {
        return bus.subscribe([&sink](const UploadEvent& event) {
            if (event.type == UploadEventType::Finalized) {
                sink.on_file_finalized(event.file);
            }
        });
    }
} // namespace ferry::core
