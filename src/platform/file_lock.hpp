#pragma once
#include <string>

// RAII advisory lock on a file. Blocks until the exclusive lock is granted.
// Uses flock() on Unix, LockFileEx() on Windows.
// Lock is released on destruction or when the process exits.
class FileLock {
public:
    // Attempts to acquire the lock. Check held() after construction.
    explicit FileLock(const std::string& lock_path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};
