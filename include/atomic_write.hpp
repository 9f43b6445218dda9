/*
 * File: include/atomic_write.hpp
 * Project: TTB Broker Proxy
 * Purpose: State file helpers
 * Notes:
 *  - See DESIGN.md
 *  - Writers never leave a half-written state file behind
 * Last updated: 2026-10-18
 */

#pragma once
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

// Atomic file writer: writes to <path>.tmp with `mode`, fsyncs, then
// rename() to final.
inline void write_atomic(const std::filesystem::path &final_path, const std::string &data, mode_t mode = 0644)
{
    std::filesystem::path tmp = final_path;
    tmp += ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (fd < 0)
        throw std::runtime_error("Failed to open temp file: " + tmp.string() + ": " + std::strerror(errno));
    // O_CREAT does not change the mode of a leftover tmp file
    if (::fchmod(fd, mode) != 0)
    {
        int err = errno;
        ::close(fd);
        throw std::runtime_error("Failed to chmod temp file: " + tmp.string() + ": " + std::strerror(err));
    }

    const char *p = data.data();
    size_t left = data.size();
    while (left > 0)
    {
        ssize_t n = ::write(fd, p, left);
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0)
        {
            int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw std::runtime_error("Failed to write temp file: " + tmp.string() + ": " + std::strerror(err));
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    ::fsync(fd);
    ::close(fd);

    if (::rename(tmp.c_str(), final_path.c_str()) != 0)
    {
        int err = errno;
        ::unlink(tmp.c_str());
        throw std::runtime_error("Failed to rename temp file: " + final_path.string() + ": " + std::strerror(err));
    }
}

inline bool read_file_all(const std::filesystem::path &p, std::string &out)
{
    std::ifstream f(p, std::ios::binary);
    if (!f)
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}
