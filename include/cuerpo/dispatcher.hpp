#pragma once

#include "cuerpo/control_message.hpp"
#include "cuerpo/output_sink.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cuerpo {

struct DispatchConfig {
    std::size_t max_pending_controls{128}; // Continuous messages kept before the oldest is dropped
    int max_note_attempts{5};              // Sends per note before giving up
    int retry_backoff_ms{2};               // First retry delay, doubled per attempt
    int idle_wait_ms{10};                  // Worker wake-up period while notes are parked
    bool verbose{false};
};

struct DispatchStats {
    uint64_t submitted{0};
    uint64_t delivered{0};
    uint64_t superseded{0};      // Replaced by a newer value before delivery
    uint64_t dropped{0};         // Continuous messages lost to backpressure or send failure
    uint64_t note_retries{0};
    uint64_t compensations{0};   // NoteOffs generated for undeliverable NoteOns
    uint64_t parked{0};          // NoteOffs moved to the parking list
    uint64_t unparked{0};        // Parked NoteOffs dropped for a newer note on their voice

    void reset() noexcept {
        submitted = 0;
        delivered = 0;
        superseded = 0;
        dropped = 0;
        note_retries = 0;
        compensations = 0;
        parked = 0;
        unparked = 0;
    }
};

// Hands messages from the pipeline to a sink without blocking the pipeline
class MessageDispatcher {
public:
    MessageDispatcher(OutputSink& sink, const DispatchConfig& config = DispatchConfig{});
    ~MessageDispatcher();

    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    // Queue a frame's messages; never touches the sink
    void submit(const MessageBatch& batch);

    // One synchronous delivery pass; returns the number of messages delivered
    std::size_t pump();

    // Deliver on a worker thread; stop() drains what is left
    void start();
    void stop();
    bool is_running() const { return running_; }

    std::size_t pending() const;
    std::size_t parked() const;
    DispatchStats get_stats() const;

private:
    void worker_fn();
    bool send_note(const ControlMessage& msg);
    void enqueue_locked(const ControlMessage& msg);
    void drop_oldest_control_locked();
    static std::string coalesce_key(const ControlMessage& msg);
    static void park(std::vector<ControlMessage>& parked, const ControlMessage& msg);
    static void unpark(std::vector<ControlMessage>& parked, int voice);

    OutputSink& sink_;
    DispatchConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::list<ControlMessage> queue_;
    std::unordered_map<std::string, std::list<ControlMessage>::iterator> pending_controls_;
    std::vector<ControlMessage> parked_;  // At most one NoteOff per voice

    mutable std::mutex stats_mutex_;
    DispatchStats stats_;

    std::atomic<bool> running_{false};
    std::thread worker_;
};

} // namespace cuerpo
