#pragma once

#include <deque>
#include <mutex>
#include <vector>

#include "ferry/core/events.hpp"
#include "ferry/core/models.hpp"

namespace ferry::protocol {
    // Most recent finalized files of this process, newest first.
    class UploadHistory {
    public:
        explicit UploadHistory(ferry::core::EventBus& bus, std::size_t capacity = 100);
        ~UploadHistory();

        UploadHistory(const UploadHistory&) = delete;
        UploadHistory& operator=(const UploadHistory&) = delete;

        [[nodiscard]] std::vector<ferry::core::FinalizedFile> recent() const;
        [[nodiscard]] ferry::core::u64 total() const;

    private:
        void record(const ferry::core::FinalizedFile& file);

        ferry::core::EventBus& bus_;
        ferry::core::SubscriptionId subscription_{};
        std::size_t capacity_;
        mutable std::mutex mutex_;
        std::deque<ferry::core::FinalizedFile> files_;
        ferry::core::u64 total_{0};
    };
} // namespace ferry::protocol
