#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "ferry/core/models.hpp"
#include "ferry/core/types.hpp"

namespace ferry::core {
    enum class UploadEventType : u8 {
        Created = 0,
        Progress = 1,
        Finalized = 2,
        Cancelled = 3,
        Failed = 4,
        Expired = 5,
    };

    [[nodiscard]] const char* upload_event_name(UploadEventType type) noexcept;

    struct UploadEvent {
        UploadEventType type{UploadEventType::Created};
        std::string upload_id;
        std::string filename;
        u64 bytes_received{0};
        u64 expected_size{0};
        StatusCode reason{StatusCode::Ok};
        FinalizedFile file;  // Finalized only
    };

    // Fan-out channel for upload lifecycle events. Handlers run on the
    // publishing thread, outside the bus lock, so a handler may subscribe,
    // unsubscribe or publish without deadlocking.
    //
    // Publishers hold per-upload locks and cannot unwind. Handlers report
    // failure by throwing std::exception, which is logged and dropped;
    // anything else escaping a handler terminates the process.
    class EventBus {
    public:
        using Handler = std::function<void(const UploadEvent&)>;

        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        SubscriptionId subscribe(Handler handler);
        void unsubscribe(SubscriptionId id);
        void publish(const UploadEvent& event) const noexcept;

        [[nodiscard]] std::size_t subscriber_count() const;

    private:
        mutable std::mutex mutex_;
        std::vector<std::pair<SubscriptionId, Handler>> handlers_;
        u64 next_id_{1};
    };

    // Receives "file finalized" notifications for the media library indexer.
    class IndexingSink {
    public:
        virtual ~IndexingSink() = default;
        virtual void on_file_finalized(const FinalizedFile& file) = 0;
    };

    SubscriptionId attach_indexing_sink(EventBus& bus, IndexingSink& sink);
} // namespace ferry::core
