#pragma once

#include "error.hpp"
#include "session.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

// Holds an flock() on the store's lock file. The lock belongs to the open
// file description, so it is dropped by the kernel when the holder dies.
class StateLock {
public:
    StateLock() = default;
    explicit StateLock(int fd) : fd_(fd) {}
    ~StateLock();

    StateLock(StateLock&& other) noexcept;
    StateLock& operator=(StateLock&& other) noexcept;
    StateLock(const StateLock&) = delete;
    StateLock& operator=(const StateLock&) = delete;

    bool held() const { return fd_ >= 0; }
    void release();

private:
    int fd_ = -1;
};

// File-backed store for the single Session record, shared by every
// invocation. All files live in one owner-only directory that may vanish at
// any time (logout); a missing directory or record reads as Idle.
class StateStore {
public:
    explicit StateStore(std::string dir);

    const std::string& dir() const { return dir_; }

    // Creates the directory 0700, tightening it if it already exists.
    std::expected<void, Error> ensure_dir() const;

    // NotFound when no record exists, Corrupt when it cannot be parsed.
    std::expected<Session, Error> load() const;

    // Write-to-temp then rename; readers see the old or the new record.
    std::expected<void, Error> save(const Session& session) const;

    std::expected<void, Error> clear() const;

    // Removes the whole state directory.
    std::expected<void, Error> remove_all() const;

    std::expected<StateLock, Error> lock() const;
    // StateConflict if another process holds the lock.
    std::expected<StateLock, Error> try_lock() const;

    template <typename Fn>
    auto with_exclusive_lock(Fn&& fn) const -> std::expected<std::invoke_result_t<Fn&>, Error> {
        auto guard = lock();
        if (!guard) return std::unexpected(guard.error());
        if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
            fn();
            return {};
        } else {
            return fn();
        }
    }

    // Text being spoken by the player.
    std::expected<void, Error> save_speech(std::string_view text) const;
    std::expected<std::string, Error> load_speech() const;
    void discard_speech() const;

    // Paragraph the player with this pid is currently speaking.
    std::expected<void, Error> save_progress(int pid, int paragraph) const;
    std::optional<int> load_progress(int pid) const;

    // Fresh, never-reused path for a new capture.
    std::string new_audio_path() const;

    std::string session_path() const;
    std::string lock_path() const;
    std::string speech_path() const;
    std::string progress_path() const;

private:
    std::expected<void, Error> write_atomic(const std::string& path, std::string_view content) const;
    std::expected<StateLock, Error> acquire(int operation) const;

    std::string dir_;
};
