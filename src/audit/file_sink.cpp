#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <stdexcept>

namespace sqlgate {

FileSink::FileSink(const Config& config)
    : config_(config) {
    fd_ = ::open(config_.output_file.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0640);
    if (fd_ < 0) {
        throw std::runtime_error(std::format("Failed to open audit file {}: {}",
            config_.output_file, std::strerror(errno)));
    }

    // A crash mid-write can leave a torn last line; start on a fresh one
    struct stat st{};
    if (::fstat(fd_, &st) == 0 && st.st_size > 0) {
        const int rfd = ::open(config_.output_file.c_str(), O_RDONLY | O_CLOEXEC);
        if (rfd >= 0) {
            char last = '\n';
            if (::pread(rfd, &last, 1, st.st_size - 1) == 1 && last != '\n') {
                needs_newline_ = true;
                utils::log::warn(std::format(
                    "Audit file {} ends with a partial record; starting a new line",
                    config_.output_file));
            }
            ::close(rfd);
        }
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view json_lines) {
    if (fd_ < 0) {
        return false;
    }

    struct stat st{};
    const off_t start = ::fstat(fd_, &st) == 0 ? st.st_size : -1;
    const bool newline_was_pending = needs_newline_;

    bool ok = true;
    if (needs_newline_) {
        ok = write_all("\n");
        if (ok) needs_newline_ = false;
    }
    if (ok && write_all(json_lines)) {
        bytes_written_ += json_lines.size();
        return true;
    }

    // Cut off whatever part of this batch reached the file so the retry
    // starts on a record boundary
    if (start >= 0 && ::ftruncate(fd_, start) == 0) {
        needs_newline_ = newline_was_pending;
    } else {
        needs_newline_ = true;
        utils::log::error(std::format("Audit file {} keeps a partial record: {}",
            config_.output_file, std::strerror(errno)));
    }
    return false;
}

bool FileSink::write_all(std::string_view data) {
    while (!data.empty()) {
        const ssize_t n = ::write(fd_, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            utils::log::error(std::format("Audit write to {} failed: {}",
                config_.output_file, std::strerror(errno)));
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

void FileSink::flush() {
    if (fd_ >= 0 && config_.fsync_on_flush) {
        if (::fsync(fd_) != 0) {
            utils::log::error(std::format("Audit fsync on {} failed: {}",
                config_.output_file, std::strerror(errno)));
        }
    }
}

void FileSink::shutdown() {
    if (fd_ >= 0) {
        flush();
        ::close(fd_);
        fd_ = -1;
        utils::log::debug(std::format("Audit file {} closed after {} bytes",
            config_.output_file, bytes_written_));
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

std::string FileSink::read_last_line(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return {};
    }
    std::string line;
    std::string last;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            last = std::move(line);
        }
    }
    return last;
}

} // namespace sqlgate
