#include "discovery/DiscoverySource.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <fstream>
#include <limits>

namespace homescout {

ReplayDiscoverySource::ReplayDiscoverySource(std::string capture_path, uint32_t pacing_ms)
    : capture_path_(std::move(capture_path)), pacing_ms_(pacing_ms) {
}

ReplayDiscoverySource::~ReplayDiscoverySource() {
    Unsubscribe();

    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

bool ReplayDiscoverySource::Subscribe(RecordCallback on_record, FailureCallback on_failure) {
    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
            LOG_WARN("ReplayDiscoverySource: re-subscribe from the replay thread is not supported");
            return false;
        }
        stop_ = true;
        previous = std::move(worker_);
    }
    wait_cv_.notify_all();
    if (previous.joinable()) {
        previous.join();
    }

    std::lock_guard<std::mutex> lock(thread_mutex_);
    on_record_ = std::move(on_record);
    on_failure_ = std::move(on_failure);
    stop_ = false;
    finished_ = false;
    delivered_ = 0;
    skipped_ = 0;

    worker_ = std::thread(&ReplayDiscoverySource::Run, this);
    LOG_INFO("ReplayDiscoverySource: replaying {}", capture_path_);
    return true;
}

void ReplayDiscoverySource::Unsubscribe() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        stop_ = true;
        // Called from a delivered callback: the worker exits once it returns
        // and is joined by the next Subscribe() or the destructor.
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker = std::move(worker_);
        }
    }
    wait_cv_.notify_all();

    if (worker.joinable()) {
        worker.join();
    }
}

void ReplayDiscoverySource::WaitUntilFinished() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait(lock, [this] { return finished_.load(); });
}

void ReplayDiscoverySource::MarkFinished() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        finished_ = true;
    }
    wait_cv_.notify_all();
}

void ReplayDiscoverySource::Run() {
    std::ifstream in(capture_path_);
    if (!in.is_open()) {
        LOG_ERROR("ReplayDiscoverySource: cannot open capture {}", capture_path_);
        if (on_failure_ && !stop_) {
            on_failure_("cannot open capture " + capture_path_);
        }
        MarkFinished();
        return;
    }

    std::string line;
    size_t line_number = 0;
    while (!stop_ && std::getline(in, line)) {
        ++line_number;
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto record = ParseLine(line);
        if (!record) {
            ++skipped_;
            LOG_WARN("ReplayDiscoverySource: skipping malformed line {} of {}", line_number, capture_path_);
            continue;
        }

        if (on_record_) {
            on_record_(*record);
        }
        ++delivered_;

        if (pacing_ms_ > 0) {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, std::chrono::milliseconds(pacing_ms_), [this] { return stop_.load(); });
        }
    }

    if (in.bad() && !stop_) {
        LOG_ERROR("ReplayDiscoverySource: read error in {}", capture_path_);
        if (on_failure_) {
            on_failure_("read error in " + capture_path_);
        }
    }

    LOG_INFO("ReplayDiscoverySource: delivered {} records ({} skipped)", delivered_.load(), skipped_.load());
    MarkFinished();
}

std::optional<RawAdvertisement> ReplayDiscoverySource::ParseLine(const std::string& line) {
    try {
        return FromJson(nlohmann::json::parse(line));
    } catch (const nlohmann::json::parse_error& ex) {
        LOG_DEBUG("ReplayDiscoverySource: parse error: {}", ex.what());
        return std::nullopt;
    }
}

std::optional<RawAdvertisement> ReplayDiscoverySource::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    try {
        RawAdvertisement raw;
        raw.instance_name = j.value("instance_name", "");
        raw.host = j.value("host", "");
        raw.service_type = j.value("service_type", "");
        raw.removed = j.value("removed", false);
        raw.received_at_ms = j.value("received_at_ms", uint64_t{0});

        // Out-of-range values are left for the validator to reject.
        if (j.contains("port") && j["port"].is_number_integer()) {
            int64_t port = j["port"].get<int64_t>();
            if (port < std::numeric_limits<int>::min() || port > std::numeric_limits<int>::max()) {
                port = -1;
            }
            raw.port = static_cast<int>(port);
        }

        if (j.contains("metadata") && j["metadata"].is_object()) {
            for (const auto& [key, value] : j["metadata"].items()) {
                raw.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        return raw;
    } catch (const nlohmann::json::exception& ex) {
        LOG_DEBUG("ReplayDiscoverySource: unexpected field type: {}", ex.what());
        return std::nullopt;
    }
}

} // namespace homescout
