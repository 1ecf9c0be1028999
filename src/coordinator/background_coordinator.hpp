#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

enum class PollState {
    Nothing,    // no operation tracked for the key
    Running,
    Finished,   // result handed over; the key is free again
};

template <typename T>
struct PollResult {
    PollState state = PollState::Nothing;
    std::optional<Result<T>> result;   // set only when Finished
    std::string label;
    std::chrono::steady_clock::duration elapsed{};
};

// Runs named multi-step operations on their own threads, at most one per key.
//
// Owned and driven by a single thread (the control loop). Operations only hand
// their result back through a future; dropping the coordinator abandons them
// without waiting, and they run to completion on their own.
template <typename Key, typename T>
class BackgroundCoordinator {
public:
    using Operation = std::function<Result<T>()>;

    BackgroundCoordinator() = default;
    BackgroundCoordinator(const BackgroundCoordinator&) = delete;
    BackgroundCoordinator& operator=(const BackgroundCoordinator&) = delete;

    ~BackgroundCoordinator() {
        if (!slots_.empty()) {
            crew_log(fmt::format("coordinator: abandoning {} in-flight operation(s)",
                                 slots_.size()));
        }
    }

    // GuardRejected if key already has an operation in flight.
    Result<void> start(const Key& key, const std::string& label, Operation op) {
        auto it = slots_.find(key);
        if (it != slots_.end()) {
            return Result<void>::Err(fmt::format("{} already in progress", it->second.label),
                                     ErrorKind::GuardRejected);
        }

        auto promise = std::make_shared<std::promise<Result<T>>>();
        Slot slot;
        slot.label = label;
        slot.started_at = std::chrono::steady_clock::now();
        slot.handle = promise->get_future();

        try {
            std::thread([promise, op = std::move(op), label]() {
                try {
                    promise->set_value(op());
                } catch (const std::exception& e) {
                    crew_log(fmt::format("coordinator: {} threw: {}", label, e.what()));
                    promise->set_value(Result<T>::Err(
                        fmt::format("{} failed: {}", label, e.what())));
                }
            }).detach();
        } catch (const std::system_error& e) {
            return Result<void>::Err(fmt::format("Cannot start {}: {}", label, e.what()),
                                     ErrorKind::Infrastructure);
        }

        slots_.emplace(key, std::move(slot));
        return Result<void>::Ok();
    }

    // Finished is reported exactly once per started operation.
    PollResult<T> poll(const Key& key) {
        PollResult<T> out;
        auto it = slots_.find(key);
        if (it == slots_.end()) return out;

        out.label = it->second.label;
        out.elapsed = std::chrono::steady_clock::now() - it->second.started_at;
        if (it->second.handle.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            out.state = PollState::Running;
            return out;
        }

        out.state = PollState::Finished;
        out.result = it->second.handle.get();
        slots_.erase(it);
        return out;
    }

    bool in_progress(const Key& key) const { return slots_.count(key) > 0; }

    std::vector<Key> keys() const {
        std::vector<Key> out;
        for (const auto& [k, _] : slots_) out.push_back(k);
        return out;
    }

    std::optional<std::string> label(const Key& key) const {
        auto it = slots_.find(key);
        if (it == slots_.end()) return std::nullopt;
        return it->second.label;
    }

    size_t size() const { return slots_.size(); }

private:
    struct Slot {
        std::string label;
        std::chrono::steady_clock::time_point started_at;
        std::future<Result<T>> handle;
    };

    std::map<Key, Slot> slots_;
};
