#include "telemetry_writer.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>
#include "../utils/logger.hpp"

namespace arbgate {

TelemetryWriter::TelemetryWriter(const TelemetryConfig& config, Clock& clock)
    : config_(config), clock_(clock) {
    if (config_.file_path.empty()) {
        return;
    }

    const std::filesystem::path path(config_.file_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            ARBGATE_LOG_ERROR("Cannot create telemetry directory {}: {}",
                              path.parent_path().string(), ec.message());
        }
    }

    file_.open(config_.file_path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        ARBGATE_LOG_ERROR("Cannot open telemetry file {}, keeping events in memory only", config_.file_path);
    }
}

TelemetryWriter::~TelemetryWriter() {
    flush();
}

void TelemetryWriter::push_event(const Event& event) {
    nlohmann::json entry;
    entry["timestamp"] = to_epoch_ms(clock_.now());
    entry["event"] = event_to_json(event);

    std::lock_guard<std::mutex> lock(mutex_);
    total_events_++;
    if (file_.is_open()) {
        file_ << entry.dump() << '\n';
        if (!file_) {
            ARBGATE_LOG_ERROR("Telemetry write to {} failed, closing file", config_.file_path);
            file_.close();
        }
    }

    buffer_.push_back(std::move(entry));
    while (buffer_.size() > config_.buffer_size) {
        buffer_.pop_front();
    }
}

std::vector<nlohmann::json> TelemetryWriter::recent(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = std::min(count, buffer_.size());
    return std::vector<nlohmann::json>(buffer_.end() - static_cast<std::ptrdiff_t>(n), buffer_.end());
}

size_t TelemetryWriter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

uint64_t TelemetryWriter::total_events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_events_;
}

bool TelemetryWriter::is_file_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void TelemetryWriter::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

} // namespace arbgate
