#include "ferry/protocol/history.hpp"

namespace ferry::protocol {
    UploadHistory::UploadHistory(ferry::core::EventBus& bus, std::size_t capacity)
        : bus_(bus), capacity_(capacity == 0 ? 1 : capacity) {
        subscription_ = bus_.subscribe([this](const ferry::core::UploadEvent& event) {
            if (event.type == ferry::core::UploadEventType::Finalized) {
                record(event.file);
            }
        });
    }

    UploadHistory::~UploadHistory() {
        bus_.unsubscribe(subscription_);
    }

    void UploadHistory::record(const ferry::core::FinalizedFile& file) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_.push_front(file);
        while (files_.size() > capacity_) {
            files_.pop_back();
        }
        ++total_;
    }

    std::vector<ferry::core::FinalizedFile> UploadHistory::recent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<ferry::core::FinalizedFile>(files_.begin(), files_.end());
    }

    ferry::core::u64 UploadHistory::total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }
} // namespace ferry::protocol
