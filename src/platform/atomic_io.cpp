#include "sweep/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace sweep {

namespace fs = std::filesystem;

namespace {

// Generate a temporary filename next to the target
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

#ifndef _WIN32
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}
#endif

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    std::string dir_path = get_parent_directory(path);
    if (!dir_path.empty() && !create_directories(dir_path)) {
        result.error = "failed to create directory: " + dir_path;
        return result;
    }

    std::string temp_path = make_temp_filename(path);

#ifdef _WIN32
    {
        std::ofstream temp_file(temp_path, std::ios::binary | std::ios::trunc);
        if (!temp_file) {
            result.error = "failed to create temp file";
            return result;
        }
        temp_file.write(content.data(), static_cast<std::streamsize>(content.size()));
        temp_file.flush();
        if (!temp_file) {
            temp_file.close();
            DeleteFileA(temp_path.c_str());
            result.error = "failed to write content";
            return result;
        }
    }

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::to_string(GetLastError());
        return result;
    }

    result.ok = true;
#else
    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    size_t total = 0;
    while (total < content.size()) {
        ssize_t written = write(fd, content.data() + total, content.size() - total);
        if (written < 0) {
            if (errno == EINTR) continue;
            close(fd);
            unlink(temp_path.c_str());
            result.error = "failed to write content: " + std::string(strerror(errno));
            return result;
        }
        total += static_cast<size_t>(written);
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    std::string result = p.string();
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

} // namespace sweep
