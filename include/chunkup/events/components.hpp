/**
 * @file components.hpp
 * @brief Ready-made subscribers for upload events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * UploadClient client(transport, options, &bus);
 */

#pragma once

#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkup::events {

/**
 * @brief Base for components that subscribe in their constructor
 *
 * Unsubscribes everything on destruction so the bus never calls into a
 * dead component.
 */
class Component {
public:
    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;

protected:
    explicit Component(EventBus& bus) : bus_(bus) {}

    ~Component() {
        for (const auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    template<typename EventType, typename Handler>
    void listen(Handler&& handler) {
        const size_t id = bus_.subscribe<EventType>(std::forward<Handler>(handler));
        unsubscribers_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;

private:
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Logs every upload event through spdlog
 *
 * Chunk traffic at debug, lifecycle at info, reconciliation at warn,
 * failures at error.
 */
class LoggerComponent : public Component {
public:
    explicit LoggerComponent(EventBus& bus) : Component(bus) {
        listen<UploadStartedEvent>([](const UploadStartedEvent& e) {
            spdlog::info("[UploadStarted] ticket={} length={} chunk_size={}",
                e.ticket_id, e.file_length, e.chunk_size);
        });

        listen<ChunkSentEvent>([](const ChunkSentEvent& e) {
            spdlog::debug("[ChunkSent] ticket={} range=[{}, {}) written={}/{}",
                e.ticket_id, e.range_start, e.range_end, e.bytes_written, e.file_length);
        });

        listen<OffsetReconciledEvent>([](const OffsetReconciledEvent& e) {
            spdlog::warn("[OffsetReconciled] ticket={} client={} server={} length={}",
                e.ticket_id, e.client_bytes_written, e.server_bytes_written, e.file_length);
        });

        listen<UploadVerifiedEvent>([](const UploadVerifiedEvent& e) {
            if (e.offset_reported) {
                spdlog::info("[UploadVerified] ticket={} status={} written={}/{}",
                    e.ticket_id, upload::to_string(e.status), e.bytes_written, e.file_length);
            } else {
                spdlog::info("[UploadVerified] ticket={} status={} (no offset reported)",
                    e.ticket_id, upload::to_string(e.status));
            }
        });

        listen<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] ticket={} clip={} length={} duration={}ms",
                e.ticket_id, e.clip_uri.empty() ? "<none>" : e.clip_uri, e.file_length, e.duration.count());
        });

        listen<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::error("[UploadFailed] ticket={} written={} retryable={} error={}",
                e.ticket_id, e.bytes_written, e.retryable, e.error_message);
        });
    }
};

/**
 * @brief Counters across all uploads observed on a bus
 */
class MetricsComponent : public Component {
public:
    struct Stats {
        std::atomic<uint64_t> uploads_started{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> chunks_sent{0};
        std::atomic<uint64_t> bytes_sent{0};
        std::atomic<uint64_t> reconciliations{0};
        std::atomic<uint64_t> bytes_resent{0};  ///< Bytes rolled back by reconciliation
        std::atomic<uint64_t> verifications{0};
    };

    explicit MetricsComponent(EventBus& bus) : Component(bus) {
        listen<UploadStartedEvent>([this](const UploadStartedEvent&) {
            stats_.uploads_started++;
        });

        listen<ChunkSentEvent>([this](const ChunkSentEvent& e) {
            stats_.chunks_sent++;
            stats_.bytes_sent += e.range_end - e.range_start;
        });

        listen<OffsetReconciledEvent>([this](const OffsetReconciledEvent& e) {
            stats_.reconciliations++;
            if (e.client_bytes_written > e.server_bytes_written) {
                stats_.bytes_resent += e.client_bytes_written - e.server_bytes_written;
            }
        });

        listen<UploadVerifiedEvent>([this](const UploadVerifiedEvent&) {
            stats_.verifications++;
        });

        listen<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        });

        listen<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Upload statistics:");
        spdlog::info("  Uploads started:   {}", stats_.uploads_started.load());
        spdlog::info("  Uploads completed: {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:    {}", stats_.uploads_failed.load());
        spdlog::info("  Chunks sent:       {}", stats_.chunks_sent.load());
        spdlog::info("  Bytes sent:        {}", stats_.bytes_sent.load());
        spdlog::info("  Reconciliations:   {}", stats_.reconciliations.load());
        spdlog::info("  Bytes resent:      {}", stats_.bytes_resent.load());
        spdlog::info("  Verifications:     {}", stats_.verifications.load());
    }

private:
    Stats stats_;
};

/**
 * @brief Latest known progress per ticket
 *
 * Progress follows the session offset, so it drops when the server
 * reports fewer bytes than the client had sent.
 */
class ProgressComponent : public Component {
public:
    struct Progress {
        std::uint64_t bytes_written = 0;
        std::uint64_t file_length = 0;
        bool completed = false;
        bool failed = false;

        double fraction() const {
            if (file_length == 0) {
                return completed ? 1.0 : 0.0;
            }
            return static_cast<double>(bytes_written) / static_cast<double>(file_length);
        }
    };

    explicit ProgressComponent(EventBus& bus) : Component(bus) {
        listen<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            update(e.ticket_id, [&](Progress& p) {
                p = Progress{};
                p.file_length = e.file_length;
            });
        });

        listen<ChunkSentEvent>([this](const ChunkSentEvent& e) {
            update(e.ticket_id, [&](Progress& p) {
                p.bytes_written = e.bytes_written;
                p.file_length = e.file_length;
            });
        });

        listen<OffsetReconciledEvent>([this](const OffsetReconciledEvent& e) {
            update(e.ticket_id, [&](Progress& p) {
                p.bytes_written = e.server_bytes_written;
            });
        });

        listen<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            update(e.ticket_id, [&](Progress& p) {
                p.bytes_written = e.file_length;
                p.file_length = e.file_length;
                p.completed = true;
                p.failed = false;
            });
        });

        listen<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            update(e.ticket_id, [&](Progress& p) {
                p.failed = true;
            });
        });
    }

    std::optional<Progress> progress(const std::string& ticket_id) const {
        std::lock_guard lock(mutex_);
        auto it = progress_.find(ticket_id);
        if (it == progress_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    template<typename Fn>
    void update(const std::string& ticket_id, Fn&& fn) {
        std::lock_guard lock(mutex_);
        fn(progress_[ticket_id]);
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Progress> progress_;
};

} // namespace chunkup::events
