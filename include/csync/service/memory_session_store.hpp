#pragma once

/// @file memory_session_store.hpp
/// @brief In-process ISessionStore for tests and offline play.

#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

#include "csync/service/persistence_gateway.hpp"

namespace csync::service {

/// Map-backed session store.
///
/// Completes synchronously by default. In deferred mode every write or
/// read is held until completePending() runs it, which lets tests observe
/// the Saving/Loading phases and race completions against other calls.
/// Records are committed when the write completes, not when it is issued.
///
/// Usage:
/// @code
///   MemorySessionStore store;
///   store.setDeferred(true);
///   gateway.save(id, doc, cb);   // cb not called yet
///   store.completePending();     // record committed, cb called
/// @endcode
class MemorySessionStore final : public ISessionStore {
public:
    MemorySessionStore() = default;

    // ISessionStore
    [[nodiscard]] bool isReady() const override { return ready_; }
    void write(SaveRecord record, WriteCallback callback) override;
    void read(const foundation::SessionId& id, ReadCallback callback) override;

    // ── Test controls ───────────────────────────────────────────────────

    void setReady(bool ready) { ready_ = ready; }

    /// Hold completions until completePending().
    void setDeferred(bool deferred) { deferred_ = deferred; }

    /// Fail every following write with @p error (nullopt clears).
    void setWriteFailure(std::optional<foundation::GameError> error) {
        writeFailure_ = std::move(error);
    }

    /// Fail every following read with @p error (nullopt clears).
    void setReadFailure(std::optional<foundation::GameError> error) {
        readFailure_ = std::move(error);
    }

    /// Throw std::runtime_error from the next write() or read() call.
    void throwOnNextCall() { throwNext_ = true; }

    /// Run held completions in issue order. Returns how many ran.
    std::size_t completePending();

    [[nodiscard]] std::size_t pendingCount() const noexcept { return pending_.size(); }

    // ── Inspection ──────────────────────────────────────────────────────

    /// Store a record directly, bypassing readiness and failure settings.
    void put(SaveRecord record);

    [[nodiscard]] std::optional<SaveRecord> find(const foundation::SessionId& id) const;
    [[nodiscard]] std::size_t recordCount() const noexcept { return records_.size(); }

    /// Number of write() calls that committed a record.
    [[nodiscard]] std::size_t writeCount() const noexcept { return writes_; }
    [[nodiscard]] std::size_t readCount() const noexcept { return reads_; }

private:
    void dispatch(std::function<void()> completion);
    void maybeThrow();

    std::unordered_map<foundation::SessionId, SaveRecord> records_;
    std::vector<std::function<void()>> pending_;
    std::optional<foundation::GameError> writeFailure_;
    std::optional<foundation::GameError> readFailure_;
    std::size_t writes_ = 0;
    std::size_t reads_ = 0;
    bool ready_ = true;
    bool deferred_ = false;
    bool throwNext_ = false;
};

} // namespace csync::service
