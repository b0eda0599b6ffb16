#include "cuerpo/dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <iostream>

namespace cuerpo {

MessageDispatcher::MessageDispatcher(OutputSink& sink, const DispatchConfig& config)
    : sink_(sink), config_(config) {}

MessageDispatcher::~MessageDispatcher() { stop(); }

std::string MessageDispatcher::coalesce_key(const ControlMessage& msg) {
    return std::string(kind_name(msg.kind)) + "|" + msg.name + "|" + std::to_string(msg.voice);
}

void MessageDispatcher::submit(const MessageBatch& batch) {
    if (batch.empty()) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& msg : batch) enqueue_locked(msg);
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.submitted += batch.size();
    }
    cv_.notify_one();
}

void MessageDispatcher::enqueue_locked(const ControlMessage& msg) {
    if (msg.is_note()) {
        queue_.push_back(msg);
        return;
    }

    // Newer value replaces the undelivered one and moves to the back
    std::string key = coalesce_key(msg);
    auto it = pending_controls_.find(key);
    if (it != pending_controls_.end()) {
        queue_.erase(it->second);
        pending_controls_.erase(it);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.superseded++;
    }
    queue_.push_back(msg);
    pending_controls_[key] = std::prev(queue_.end());

    if (pending_controls_.size() > config_.max_pending_controls) {
        drop_oldest_control_locked();
    }
}

void MessageDispatcher::drop_oldest_control_locked() {
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->is_note()) continue;
        pending_controls_.erase(coalesce_key(*it));
        queue_.erase(it);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.dropped++;
        return;
    }
}

void MessageDispatcher::park(std::vector<ControlMessage>& parked, const ControlMessage& msg) {
    for (const auto& p : parked) {
        if (p.voice == msg.voice) return;
    }
    parked.push_back(msg);
}

void MessageDispatcher::unpark(std::vector<ControlMessage>& parked, int voice) {
    parked.erase(std::remove_if(parked.begin(), parked.end(),
                                [voice](const ControlMessage& p) { return p.voice == voice; }),
                 parked.end());
}

bool MessageDispatcher::send_note(const ControlMessage& msg) {
    int backoff_ms = config_.retry_backoff_ms;
    for (int attempt = 1; attempt <= config_.max_note_attempts; ++attempt) {
        if (deliver(sink_, msg)) return true;
        if (attempt == config_.max_note_attempts) break;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.note_retries++;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        backoff_ms *= 2;
    }
    return false;
}

std::size_t MessageDispatcher::pump() {
    std::list<ControlMessage> work;
    std::vector<ControlMessage> parked;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        work.swap(queue_);
        pending_controls_.clear();
        parked.swap(parked_);
    }
    if (work.empty() && parked.empty()) return 0;

    std::size_t delivered = 0;
    std::vector<ControlMessage> still_parked;
    uint64_t dropped = 0, compensations = 0, newly_parked = 0, unparked = 0;

    // Parked NoteOffs go out before anything newer
    for (const auto& msg : parked) {
        if (deliver(sink_, msg)) {
            ++delivered;
        } else {
            park(still_parked, msg);
        }
    }

    while (!work.empty()) {
        ControlMessage msg = work.front();
        work.pop_front();

        if (!msg.is_note()) {
            if (deliver(sink_, msg)) {
                ++delivered;
            } else {
                ++dropped;
            }
            continue;
        }

        if (send_note(msg)) {
            ++delivered;
            // A newer note owns the voice; the old NoteOff would cut it short
            if (msg.kind == MessageKind::NoteOn) {
                std::size_t before = still_parked.size();
                unpark(still_parked, msg.voice);
                unparked += before - still_parked.size();
            }
        } else if (msg.kind == MessageKind::NoteOn) {
            // The voice may already sound downstream
            ++compensations;
            work.push_front(ControlMessage::note_off(msg.voice));
            std::cerr << "[Dispatcher] NoteOn voice " << msg.voice << " undeliverable on "
                      << sink_.name() << ", sending NoteOff\n";
        } else {
            std::size_t before = still_parked.size();
            park(still_parked, msg);
            newly_parked += still_parked.size() - before;
            std::cerr << "[Dispatcher] NoteOff voice " << msg.voice << " undeliverable on "
                      << sink_.name() << ", parked\n";
        }
    }

    if (!sink_.flush() && config_.verbose) {
        std::cerr << "[Dispatcher] Flush failed on " << sink_.name() << "\n";
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Anything parked by a concurrent pass stays behind ours
        for (const auto& msg : parked_) park(still_parked, msg);
        parked_.swap(still_parked);
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.delivered += delivered;
        stats_.dropped += dropped;
        stats_.compensations += compensations;
        stats_.parked += newly_parked;
        stats_.unparked += unparked;
    }
    return delivered;
}

void MessageDispatcher::start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&MessageDispatcher::worker_fn, this);
    if (config_.verbose) {
        std::cerr << "[Dispatcher] Started for " << sink_.name() << "\n";
    }
}

void MessageDispatcher::stop() {
    if (running_) {
        running_ = false;
        cv_.notify_all();
    }
    if (worker_.joinable()) worker_.join();
    // Drain
    pump();
}

void MessageDispatcher::worker_fn() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(config_.idle_wait_ms),
                         [this] { return !queue_.empty() || !running_; });
        }
        pump();
    }
}

std::size_t MessageDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t MessageDispatcher::parked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parked_.size();
}

DispatchStats MessageDispatcher::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace cuerpo
