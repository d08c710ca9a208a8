/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 * @author Dimitris Kafetzis
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>

namespace edit_orchestrator {

namespace fs = std::filesystem;

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const fs::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::error_code ec;
    fs::create_directories(log_dir_, ec);
    open_current();
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

fs::path JsonFileSink::current_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

fs::path JsonFileSink::rotated_path(uint32_t index) const {
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
}

void JsonFileSink::open_current() {
    current_file_.open(current_path(), std::ios::app);
    std::error_code ec;
    auto size = fs::file_size(current_path(), ec);
    current_size_ = ec ? 0 : size;
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed(json_line.size() + 1);
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed(size_t incoming) {
    if (max_file_size_bytes_ == 0 || current_size_ == 0
        || current_size_ + incoming <= max_file_size_bytes_) {
        return;
    }

    current_file_.close();
    std::error_code ec;
    if (max_files_ == 0) {
        fs::remove(current_path(), ec);
    } else {
        fs::remove(rotated_path(max_files_), ec);
        for (uint32_t i = max_files_; i > 1; --i) {
            if (fs::exists(rotated_path(i - 1), ec)) {
                fs::rename(rotated_path(i - 1), rotated_path(i), ec);
            }
        }
        fs::rename(current_path(), rotated_path(1), ec);
    }
    open_current();
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

}  // namespace edit_orchestrator
