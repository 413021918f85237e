#include "state_store.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Error io_error(const std::string& what) {
    return Error{ErrorCode::Io, what + ": " + std::strerror(errno)};
}

} // namespace

StateLock::~StateLock() {
    release();
}

StateLock::StateLock(StateLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

StateLock& StateLock::operator=(StateLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void StateLock::release() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

StateStore::StateStore(std::string dir) : dir_(std::move(dir)) {}

std::string StateStore::session_path() const { return dir_ + "/session.json"; }
std::string StateStore::lock_path() const { return dir_ + "/lock"; }
std::string StateStore::speech_path() const { return dir_ + "/speech.txt"; }
std::string StateStore::progress_path() const { return dir_ + "/progress"; }

std::expected<void, Error> StateStore::ensure_dir() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return std::unexpected(Error{ErrorCode::Io,
                                     std::format("create {}: {}", dir_, ec.message())});
    }

    struct stat st{};
    if (::stat(dir_.c_str(), &st) < 0) return std::unexpected(io_error("stat " + dir_));
    if (st.st_uid != ::getuid()) {
        return std::unexpected(Error{ErrorCode::Io,
                                     std::format("{} is owned by uid {}", dir_, st.st_uid)});
    }
    if ((st.st_mode & 0777) != 0700 && ::chmod(dir_.c_str(), 0700) < 0) {
        return std::unexpected(io_error("chmod " + dir_));
    }
    return {};
}

std::expected<Session, Error> StateStore::load() const {
    std::error_code ec;
    if (!fs::exists(session_path(), ec)) {
        return std::unexpected(Error{ErrorCode::NotFound, "no session"});
    }

    std::ifstream f(session_path());
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorCode::Io, "cannot open " + session_path()});
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorCode::Corrupt, e.what()});
    }
    return session_from_json(j);
}

std::expected<void, Error> StateStore::save(const Session& session) const {
    if (auto ok = validate(session); !ok) return ok;
    if (auto ok = ensure_dir(); !ok) return ok;
    return write_atomic(session_path(), session_to_json(session).dump());
}

std::expected<void, Error> StateStore::clear() const {
    if (::unlink(session_path().c_str()) < 0 && errno != ENOENT) {
        return std::unexpected(io_error("unlink " + session_path()));
    }
    return {};
}

std::expected<void, Error> StateStore::remove_all() const {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        return std::unexpected(Error{ErrorCode::Io,
                                     std::format("remove {}: {}", dir_, ec.message())});
    }
    return {};
}

std::expected<StateLock, Error> StateStore::lock() const {
    return acquire(LOCK_EX);
}

std::expected<StateLock, Error> StateStore::try_lock() const {
    return acquire(LOCK_EX | LOCK_NB);
}

std::expected<StateLock, Error> StateStore::acquire(int operation) const {
    while (true) {
        if (auto ok = ensure_dir(); !ok) return std::unexpected(ok.error());

        // O_CLOEXEC: a spawned child must never inherit the lock.
        int fd = ::open(lock_path().c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd < 0) return std::unexpected(io_error("open " + lock_path()));

        while (::flock(fd, operation) < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            if (err == EWOULDBLOCK) {
                return std::unexpected(Error{ErrorCode::StateConflict, "state is locked by another invocation"});
            }
            errno = err;
            return std::unexpected(io_error("flock " + lock_path()));
        }

        // The directory may have been removed while we waited; a lock on an
        // unlinked file excludes nobody, so start over on the new one.
        struct stat held{};
        struct stat current{};
        if (::fstat(fd, &held) == 0 && ::stat(lock_path().c_str(), &current) == 0 &&
            held.st_dev == current.st_dev && held.st_ino == current.st_ino) {
            return StateLock(fd);
        }
        ::close(fd);
    }
}

std::expected<void, Error> StateStore::save_speech(std::string_view text) const {
    if (auto ok = ensure_dir(); !ok) return ok;
    return write_atomic(speech_path(), text);
}

std::expected<std::string, Error> StateStore::load_speech() const {
    std::ifstream f(speech_path());
    if (!f.is_open()) return std::unexpected(Error{ErrorCode::NotFound, "no speech text"});
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void StateStore::discard_speech() const {
    ::unlink(speech_path().c_str());
    ::unlink(progress_path().c_str());
}

std::expected<void, Error> StateStore::save_progress(int pid, int paragraph) const {
    return write_atomic(progress_path(), std::format("{} {}\n", pid, paragraph));
}

std::optional<int> StateStore::load_progress(int pid) const {
    std::ifstream f(progress_path());
    if (!f.is_open()) return std::nullopt;
    int owner = 0;
    int paragraph = 0;
    if (!(f >> owner >> paragraph) || owner != pid || paragraph < 0) return std::nullopt;
    return paragraph;
}

std::string StateStore::new_audio_path() const {
    static std::atomic<unsigned> counter{0};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::format("{}/recording-{}-{}-{}.wav", dir_, ms, ::getpid(), counter++);
}

std::expected<void, Error> StateStore::write_atomic(const std::string& path,
                                                    std::string_view content) const {
    std::string tmpl = path + ".XXXXXX";
    int fd = ::mkostemp(tmpl.data(), O_CLOEXEC);
    if (fd < 0) return std::unexpected(io_error("mkostemp " + path));

    auto fail = [&](const std::string& what) {
        auto err = io_error(what);
        ::close(fd);
        ::unlink(tmpl.c_str());
        return std::unexpected(err);
    };

    size_t total_written = 0;
    while (total_written < content.size()) {
        ssize_t n = ::write(fd, content.data() + total_written, content.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail("write " + tmpl);
        }
        total_written += static_cast<size_t>(n);
    }

    if (::fchmod(fd, 0600) < 0) return fail("fchmod " + tmpl);
    if (::fsync(fd) < 0) return fail("fsync " + tmpl);
    ::close(fd);

    if (::rename(tmpl.c_str(), path.c_str()) < 0) {
        auto err = io_error("rename " + tmpl);
        ::unlink(tmpl.c_str());
        return std::unexpected(err);
    }
    return {};
}
