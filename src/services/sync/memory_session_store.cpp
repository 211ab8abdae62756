#include "csync/service/memory_session_store.hpp"

#include <stdexcept>

namespace csync::service {

using foundation::GameResult;
using foundation::SessionId;

void MemorySessionStore::maybeThrow() {
    if (throwNext_) {
        throwNext_ = false;
        throw std::runtime_error("memory store: injected exception");
    }
}

void MemorySessionStore::dispatch(std::function<void()> completion) {
    if (deferred_) {
        pending_.push_back(std::move(completion));
    } else {
        completion();
    }
}

void MemorySessionStore::write(SaveRecord record, WriteCallback callback) {
    maybeThrow();
    auto failure = writeFailure_;
    dispatch([this, record = std::move(record), callback = std::move(callback),
              failure = std::move(failure)]() mutable {
        if (failure) {
            callback(GameResult<void>::err(*failure));
            return;
        }
        auto id = record.sessionId;
        records_[id] = std::move(record);
        ++writes_;
        callback(GameResult<void>::ok());
    });
}

void MemorySessionStore::read(const SessionId& id, ReadCallback callback) {
    maybeThrow();
    auto failure = readFailure_;
    dispatch([this, id, callback = std::move(callback),
              failure = std::move(failure)]() {
        using ReadResult = GameResult<std::optional<SaveRecord>>;
        ++reads_;
        if (failure) {
            callback(ReadResult::err(*failure));
            return;
        }
        callback(ReadResult::ok(find(id)));
    });
}

std::size_t MemorySessionStore::completePending() {
    // Completions queued while running belong to the next call.
    std::vector<std::function<void()>> batch;
    batch.swap(pending_);
    for (auto& completion : batch) {
        completion();
    }
    return batch.size();
}

void MemorySessionStore::put(SaveRecord record) {
    auto id = record.sessionId;
    records_[id] = std::move(record);
}

std::optional<SaveRecord> MemorySessionStore::find(const SessionId& id) const {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace csync::service
