#include "discovery/DiscoveryCoordinator.hpp"
#include "core/Logger.hpp"
#include "core/ThreadPool.hpp"
#include <fmt/format.h>
#include <openssl/rand.h>
#include <algorithm>
#include <chrono>
#include <cstdio>

namespace homescout {

namespace {

// Coordinator whose observers are currently being called on this thread.
thread_local const DiscoveryCoordinator* t_delivering = nullptr;

class DeliveryScope {
public:
    explicit DeliveryScope(const DiscoveryCoordinator* owner)
        : previous_(t_delivering) {
        t_delivering = owner;
    }
    ~DeliveryScope() { t_delivering = previous_; }

    DeliveryScope(const DeliveryScope&) = delete;
    DeliveryScope& operator=(const DeliveryScope&) = delete;

private:
    const DiscoveryCoordinator* previous_;
};

std::string JoinReasons(const std::vector<std::string>& reasons) {
    std::string out;
    for (const auto& reason : reasons) {
        if (!out.empty()) out += "; ";
        out += reason;
    }
    return out;
}

} // namespace

std::string ScanStateToString(ScanState state) {
    switch (state) {
        case ScanState::IDLE:      return "IDLE";
        case ScanState::SCANNING:  return "SCANNING";
        case ScanState::PAUSED:    return "PAUSED";
        case ScanState::COMPLETED: return "COMPLETED";
        case ScanState::CANCELLED: return "CANCELLED";
        default:                   return "UNKNOWN";
    }
}

DiscoveryCoordinator::Session::Session(std::string session_id, const ScanConfig& scan_config,
                                       EventBus& bus, uint64_t now)
    : id(std::move(session_id)),
      config(scan_config),
      started_at(now),
      validator(scan_config.validator, scan_config.scoring.smart_home_service_types),
      limiter(scan_config.rate_limit),
      detector(scan_config.scoring.expected_ports),
      scorer(scan_config.scoring),
      registry(scan_config.registry.max_devices, &bus, id),
      last_event_at(now) {
}

void DiscoveryCoordinator::AtomicCounters::Reset() {
    received = 0;
    accepted = 0;
    rejected = 0;
    suppressed = 0;
    ignored = 0;
    buffered = 0;
    fields_dropped = 0;
    anomalies = 0;
    added = 0;
    updated = 0;
    evicted = 0;
}

DiscoveryCoordinator::DiscoveryCoordinator(EventBus& bus, HistorySink* history,
                                           DiscoverySource* source, Clock clock)
    : bus_(bus), history_(history), source_(source), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = SystemClock;
    }
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    ScanState state = state_.load();
    if (state == ScanState::SCANNING || state == ScanState::PAUSED) {
        Finish(ScanState::CANCELLED, "coordinator shutting down", "");
    }

    if (history_pool_) {
        history_pool_->Shutdown();
    }
}

// --- Control surface ---

bool DiscoveryCoordinator::Start(const ScanConfig& config) {
    if (IsReentrant("Start")) {
        return false;
    }

    auto session_id = GenerateSessionId();
    if (!session_id) {
        return false;
    }

    uint64_t now = clock_();
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        ScanState current = state_.load();
        if (current == ScanState::SCANNING || current == ScanState::PAUSED) {
            LOG_WARN("Start ignored: scan {} is {}", GetSessionId(), ScanStateToString(current));
            return false;
        }

        auto session = std::make_shared<Session>(*session_id, config, bus_, now);
        if (!session->validator.SetNetworkRange(config.network_range)) {
            LOG_ERROR("Start rejected: invalid network range '{}'", config.network_range);
            return false;
        }

        if (history_ && !history_pool_) {
            history_pool_ = std::make_unique<ThreadPool>(config.history_threads, config.history_queue_limit);
        }

        counters_.Reset();
        {
            std::lock_guard<std::mutex> session_lock(session_mutex_);
            session_ = session;
        }

        DeliveryScope scope(this);
        if (current != ScanState::IDLE) {
            SetState(ScanState::IDLE, "new session");
        }
        SetState(ScanState::SCANNING, fmt::format("mode={} duration_ms={} range={}",
                                                  ScanModeToString(config.mode),
                                                  config.GetDurationMs(),
                                                  config.network_range.empty() ? "any" : config.network_range));
    }

    SubscribeSource(*session_id);
    return true;
}

bool DiscoveryCoordinator::Pause() {
    if (IsReentrant("Pause")) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (state_.load() != ScanState::SCANNING) {
        LOG_WARN("Pause ignored: scan is {}", ScanStateToString(state_.load()));
        return false;
    }

    auto session = CurrentSession();
    session->paused_since = clock_();

    DeliveryScope scope(this);
    SetState(ScanState::PAUSED, fmt::format("requested, policy={}",
                                            PausePolicyToString(session->config.pause_policy)));
    return true;
}

bool DiscoveryCoordinator::Resume() {
    if (IsReentrant("Resume")) {
        return false;
    }

    std::deque<RawAdvertisement> replay;
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        if (state_.load() != ScanState::PAUSED) {
            LOG_WARN("Resume ignored: scan is {}", ScanStateToString(state_.load()));
            return false;
        }

        auto session = CurrentSession();
        uint64_t now = clock_();
        uint64_t since = session->paused_since.exchange(0);
        if (now > since) {
            session->paused_total_ms += now - since;
        }
        session->last_event_at = now;
        session->stall_warned = false;

        {
            std::lock_guard<std::mutex> buffer_lock(session->buffer_mutex);
            replay.swap(session->pause_buffer);
        }

        DeliveryScope scope(this);
        SetState(ScanState::SCANNING, fmt::format("resumed, replaying {} buffered", replay.size()));
    }

    for (const auto& raw : replay) {
        Dispatch(raw);
    }
    return true;
}

bool DiscoveryCoordinator::Cancel() {
    return Finish(ScanState::CANCELLED, "cancelled", "");
}

bool DiscoveryCoordinator::Complete() {
    return Finish(ScanState::COMPLETED, "completed", "");
}

bool DiscoveryCoordinator::Finish(ScanState terminal, const std::string& reason,
                                  const std::string& degraded_reason) {
    if (IsReentrant(terminal == ScanState::CANCELLED ? "Cancel" : "Complete")) {
        return false;
    }

    std::string session_id;
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        ScanState current = state_.load();
        if (current != ScanState::SCANNING && current != ScanState::PAUSED) {
            LOG_WARN("{} ignored: scan is {}", ScanStateToString(terminal), ScanStateToString(current));
            return false;
        }

        auto session = CurrentSession();
        uint64_t now = clock_();
        if (current == ScanState::PAUSED) {
            uint64_t since = session->paused_since.exchange(0);
            if (now > since) {
                session->paused_total_ms += now - since;
            }
        }
        session->finished_at = now;

        size_t discarded = 0;
        {
            std::lock_guard<std::mutex> buffer_lock(session->buffer_mutex);
            discarded = session->pause_buffer.size();
            session->pause_buffer.clear();
        }
        if (discarded > 0) {
            LOG_INFO("Scan {}: discarded {} buffered advertisements", session->id, discarded);
        }

        DeliveryScope scope(this);
        if (!degraded_reason.empty()) {
            LOG_WARN("Scan {} degraded: {}", session->id, degraded_reason);
            Event degraded(EventType::SCAN_DEGRADED, now, session->id);
            degraded.metadata["reason"] = degraded_reason;
            bus_.Publish(degraded);
        }

        SetState(terminal, reason);
        PublishProgress(*session, true);
        session_id = session->id;

        ScanCounters counters = GetCounters();
        LOG_INFO("Scan {} finished: {} devices, {} received, {} accepted, {} rejected, {} suppressed",
                 session->id, session->registry.Size(), counters.received, counters.accepted,
                 counters.rejected, counters.suppressed);
    }

    UnsubscribeSource(session_id);
    return true;
}

void DiscoveryCoordinator::SetState(ScanState next, const std::string& reason) {
    ScanState previous = state_.exchange(next);
    std::string session_id = GetSessionId();

    LOG_INFO("Scan {} state: {} -> {} (reason: {})",
             session_id, ScanStateToString(previous), ScanStateToString(next), reason);

    Event event(EventType::SCAN_STATE_CHANGE, clock_(), session_id);
    event.metadata["from_state"] = ScanStateToString(previous);
    event.metadata["to_state"] = ScanStateToString(next);
    event.metadata["reason"] = reason;
    bus_.Publish(event);
}

// --- Event path ---

void DiscoveryCoordinator::OnAdvertisement(const RawAdvertisement& raw) {
    ++counters_.received;
    Dispatch(raw);
}

void DiscoveryCoordinator::OnSourceFailure(const std::string& reason) {
    ScanState state = state_.load();
    if (state != ScanState::SCANNING && state != ScanState::PAUSED) {
        LOG_DEBUG("Source failure after scan ended: {}", reason);
        return;
    }
    Finish(ScanState::COMPLETED, "discovery source failed", reason);
}

void DiscoveryCoordinator::Dispatch(const RawAdvertisement& raw) {
    if (t_delivering == this) {
        LOG_WARN("Advertisement submitted from an observer callback; ignored");
        ++counters_.ignored;
        return;
    }

    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    ScanState state = state_.load();
    auto session = CurrentSession();

    if (state == ScanState::PAUSED && session) {
        if (session->config.pause_policy == PausePolicy::BUFFER && session->config.pause_buffer_size > 0) {
            std::lock_guard<std::mutex> buffer_lock(session->buffer_mutex);
            if (session->pause_buffer.size() >= session->config.pause_buffer_size) {
                session->pause_buffer.pop_front();
                ++counters_.ignored;
            }
            session->pause_buffer.push_back(raw);
            ++counters_.buffered;
        } else {
            ++counters_.ignored;
        }
        return;
    }

    if (state != ScanState::SCANNING || !session) {
        ++counters_.ignored;
        return;
    }

    DeliveryScope scope(this);
    ProcessAdvertisement(*session, raw);
}

void DiscoveryCoordinator::ProcessAdvertisement(Session& session, const RawAdvertisement& raw) {
    uint64_t now = clock_();
    session.last_event_at = now;

    ValidationOutcome outcome = session.validator.Validate(raw, now);
    if (!outcome.dropped_fields.empty()) {
        counters_.fields_dropped += outcome.dropped_fields.size();
        LOG_DEBUG("Scan {}: dropped {} fields from advertisement", session.id, outcome.dropped_fields.size());
    }
    if (!outcome.accepted) {
        ++counters_.rejected;
        LOG_DEBUG("Scan {}: rejected advertisement ({}: {})",
                  session.id, RejectionReasonToString(outcome.reason), outcome.detail);
        return;
    }

    const DiscoveredDevice& incoming = outcome.device;
    if (!session.limiter.CheckAndRecord(incoming.ip, incoming.last_seen)) {
        ++counters_.suppressed;
        return;
    }
    ++counters_.accepted;

    {
        std::lock_guard<std::mutex> host_lock(session.host_mutex);
        session.current_host = incoming.ip;
    }

    if (raw.removed) {
        ProcessGoodbye(session, incoming);
        return;
    }

    const ValidatorLimits& limits = session.config.validator;

    // Lookup, anomaly detection, scoring and admission for one device key
    // must not interleave with another event for the same key.
    std::lock_guard<std::mutex> key_lock(KeyLock(incoming.key));

    std::optional<DeviceRecord> prior = session.registry.Get(incoming.key);

    DeviceRecord record;
    record.device = prior ? MergeDevice(prior->device, incoming, limits) : incoming;

    std::vector<Anomaly> fresh = session.detector.Detect(prior ? &prior->device : nullptr, incoming);
    size_t appended = MergeAnomalies(record.device.anomalies, fresh, limits.max_anomalies);
    if (appended > 0) {
        counters_.anomalies += appended;
        LOG_INFO("Scan {}: {} new anomalies on {}", session.id, appended, incoming.key);
    }

    record.assessment = session.scorer.Score(record.device, record.device.anomalies);

    RegistryDelta delta = session.registry.Upsert(record.device, record.assessment);

    if (delta.evicted) {
        ++counters_.evicted;
        if (delta.evicted_record) {
            PublishDelta(session, EventType::DEVICE_EVICTED, *delta.evicted_record);
        }
    }
    if (delta.added) {
        ++counters_.added;
        PublishDelta(session, EventType::DEVICE_ADDED, record);
    } else if (delta.updated) {
        ++counters_.updated;
        PublishDelta(session, EventType::DEVICE_UPDATED, record);
    }

    bool was_high = prior && prior->assessment.threat == ThreatLevel::HIGH;
    if (record.assessment.threat == ThreatLevel::HIGH && !was_high) {
        PublishThreat(session, record);
    }

    RecordHistory(record, record.device.last_seen);
    PublishProgress(session, false);
}

void DiscoveryCoordinator::ProcessGoodbye(Session& session, const DiscoveredDevice& incoming) {
    std::lock_guard<std::mutex> key_lock(KeyLock(incoming.key));

    auto record = session.registry.MarkOffline(incoming.key, incoming.last_seen);
    if (!record) {
        LOG_DEBUG("Scan {}: goodbye for unknown or offline device {}", session.id, incoming.key);
        return;
    }

    ++counters_.updated;
    LOG_INFO("Scan {}: device {} went offline", session.id, incoming.key);
    PublishDelta(session, EventType::DEVICE_UPDATED, *record);
    RecordHistory(*record, incoming.last_seen);
    PublishProgress(session, false);
}

DiscoveredDevice DiscoveryCoordinator::MergeDevice(const DiscoveredDevice& prior,
                                                   const DiscoveredDevice& incoming,
                                                   const ValidatorLimits& limits) const {
    DiscoveredDevice merged = incoming;
    merged.first_seen = prior.first_seen;
    merged.last_seen = std::max(prior.last_seen, incoming.last_seen);

    if (incoming.name.empty()) {
        merged.name = prior.name;
        merged.name_malformed = prior.name_malformed;
    }
    if (!incoming.mac) {
        merged.mac = prior.mac;
    }

    // Enum order is preference order: a device seen advertising a
    // home-automation service keeps that category.
    merged.category = std::min(prior.category, incoming.category);

    merged.service_types = prior.service_types;
    for (const auto& type : incoming.service_types) {
        if (merged.service_types.size() >= limits.max_service_types) break;
        if (std::find(merged.service_types.begin(), merged.service_types.end(), type) ==
            merged.service_types.end()) {
            merged.service_types.push_back(type);
        }
    }

    merged.ports = prior.ports;
    for (uint16_t port : incoming.ports) {
        auto it = std::lower_bound(merged.ports.begin(), merged.ports.end(), port);
        if (it != merged.ports.end() && *it == port) continue;
        if (merged.ports.size() >= limits.max_ports) break;
        merged.ports.insert(it, port);
    }

    merged.anomalies = prior.anomalies;
    merged.online = true;
    return merged;
}

// --- Watchdog ---

void DiscoveryCoordinator::Tick() {
    if (IsReentrant("Tick")) {
        return;
    }

    std::string finish_reason;
    std::string degraded_reason;
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        if (state_.load() != ScanState::SCANNING) {
            return;
        }
        auto session = CurrentSession();
        if (!session) {
            return;
        }

        const ScanConfig& config = session->config;
        uint64_t now = clock_();
        uint64_t duration = config.GetDurationMs();
        uint64_t elapsed = ElapsedMs(*session, ScanState::SCANNING, now);
        uint64_t last = session->last_event_at.load();
        uint64_t idle = now > last ? now - last : 0;

        if (duration > 0 && elapsed >= duration) {
            finish_reason = "scan duration elapsed";
        } else if (config.stall_timeout_ms > 0 && idle >= config.stall_timeout_ms) {
            finish_reason = fmt::format("no advertisements for {} ms", idle);
            if (!session->stall_warned.load()) {
                degraded_reason = finish_reason;
            }
        } else {
            DeliveryScope scope(this);
            if (config.stall_warning_ms > 0 && idle >= config.stall_warning_ms &&
                !session->stall_warned.exchange(true)) {
                LOG_WARN("Scan {}: no advertisements for {} ms", session->id, idle);
                Event degraded(EventType::SCAN_DEGRADED, now, session->id);
                degraded.metadata["reason"] = fmt::format("no advertisements for {} ms", idle);
                degraded.metadata["idle_ms"] = std::to_string(idle);
                bus_.Publish(degraded);
            }
            PublishProgress(*session, false);
        }
    }

    if (!finish_reason.empty()) {
        Finish(ScanState::COMPLETED, finish_reason, degraded_reason);
    }
}

// --- Publication ---

void DiscoveryCoordinator::PublishProgress(const Session& session, bool final_update) {
    uint64_t now = clock_();
    ScanProgress progress = BuildProgress(session, state_.load(), now);
    ScanCounters counters = GetCounters();

    Event event(EventType::SCAN_PROGRESS, now, session.id);
    event.metadata["state"] = ScanStateToString(progress.state);
    event.metadata["devices_found"] = std::to_string(progress.devices_found);
    event.metadata["threats_found"] = std::to_string(progress.threats_found);
    event.metadata["elapsed_ms"] = std::to_string(progress.elapsed_ms);
    event.metadata["current_host"] = progress.current_host;
    event.metadata["progress"] = fmt::format("{:.3f}", progress.progress_fraction);
    event.metadata["final"] = final_update ? "true" : "false";
    event.metadata["received"] = std::to_string(counters.received);
    event.metadata["accepted"] = std::to_string(counters.accepted);
    event.metadata["rejected"] = std::to_string(counters.rejected);
    event.metadata["suppressed"] = std::to_string(counters.suppressed);
    bus_.Publish(event);
}

void DiscoveryCoordinator::PublishDelta(const Session& session, EventType type, const DeviceRecord& record) {
    Event event(type, clock_(), session.id, record.device.key);
    event.metadata["name"] = record.device.name;
    event.metadata["ip"] = record.device.ip;
    event.metadata["mac"] = record.device.mac.value_or("");
    event.metadata["category"] = ServiceCategoryToString(record.device.category);
    event.metadata["score"] = std::to_string(record.assessment.score);
    event.metadata["threat"] = ThreatLevelToString(record.assessment.threat);
    event.metadata["online"] = record.device.online ? "true" : "false";
    bus_.Publish(event);
}

void DiscoveryCoordinator::PublishThreat(const Session& session, const DeviceRecord& record) {
    LOG_WARN("Scan {}: unpaired accessory {} ({}) scored {}",
             session.id, record.device.name, record.device.ip, record.assessment.score);

    Event event(EventType::THREAT_DETECTED, clock_(), session.id, record.device.key);
    event.metadata["name"] = record.device.name;
    event.metadata["ip"] = record.device.ip;
    event.metadata["score"] = std::to_string(record.assessment.score);
    event.metadata["reasons"] = JoinReasons(record.assessment.reasons);
    bus_.Publish(event);
}

void DiscoveryCoordinator::RecordHistory(const DeviceRecord& record, uint64_t timestamp) {
    if (!history_ || !history_pool_) {
        return;
    }

    HistorySink* sink = history_;
    HistoryRecord entry{record.device, record.assessment, timestamp};
    bool queued = history_pool_->TrySubmit([sink, entry]() {
        if (!sink->Put(entry)) {
            LOG_WARN("History write failed for {}", entry.device.key);
        }
    });
    if (!queued) {
        LOG_WARN("History queue full, dropped record for {}", record.device.key);
    }
}

void DiscoveryCoordinator::FlushHistory() {
    if (history_pool_) {
        history_pool_->WaitIdle();
    }
}

// --- Source subscription ---

void DiscoveryCoordinator::SubscribeSource(const std::string& session_id) {
    if (!source_) {
        return;
    }

    // source_mutex_ only guards subscribed_session_. It is never held while
    // calling into the source, whose threads may report failure through
    // Finish() and UnsubscribeSource() at any time.
    bool had_previous = false;
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        had_previous = !subscribed_session_.empty();
        subscribed_session_.clear();
    }
    if (had_previous) {
        source_->Unsubscribe();
    }

    if (!IsSessionActive(session_id)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        subscribed_session_ = session_id;
    }

    bool ok = source_->Subscribe(
        [this](const RawAdvertisement& raw) { OnAdvertisement(raw); },
        [this](const std::string& reason) { OnSourceFailure(reason); });
    if (!ok) {
        {
            std::lock_guard<std::mutex> lock(source_mutex_);
            if (subscribed_session_ == session_id) {
                subscribed_session_.clear();
            }
        }
        LOG_ERROR("Scan {}: discovery source refused subscription", session_id);
        OnSourceFailure("discovery source refused subscription");
        return;
    }

    // The session may have ended while Subscribe() ran, possibly from the
    // source's own failure callback.
    if (GetSessionId() == session_id && !IsSessionActive(session_id)) {
        {
            std::lock_guard<std::mutex> lock(source_mutex_);
            if (subscribed_session_ == session_id) {
                subscribed_session_.clear();
            }
        }
        source_->Unsubscribe();
    }
}

void DiscoveryCoordinator::UnsubscribeSource(const std::string& session_id) {
    if (!source_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        if (subscribed_session_.empty() || subscribed_session_ != session_id) {
            return;
        }
        subscribed_session_.clear();
    }
    source_->Unsubscribe();
}

bool DiscoveryCoordinator::IsSessionActive(const std::string& session_id) const {
    ScanState state = state_.load();
    return GetSessionId() == session_id && (state == ScanState::SCANNING || state == ScanState::PAUSED);
}

// --- Queries ---

std::shared_ptr<DiscoveryCoordinator::Session> DiscoveryCoordinator::CurrentSession() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

ScanProgress DiscoveryCoordinator::GetProgress() const {
    auto session = CurrentSession();
    if (!session) {
        return ScanProgress{};
    }
    return BuildProgress(*session, state_.load(), clock_());
}

ScanProgress DiscoveryCoordinator::BuildProgress(const Session& session, ScanState state, uint64_t now) const {
    ScanProgress progress;
    progress.state = state;
    progress.session_id = session.id;
    progress.devices_found = session.registry.Size();
    progress.threats_found = session.registry.GetThreatCount(ThreatLevel::HIGH);
    progress.elapsed_ms = ElapsedMs(session, state, now);
    {
        std::lock_guard<std::mutex> lock(session.host_mutex);
        progress.current_host = session.current_host;
    }

    uint64_t duration = session.config.GetDurationMs();
    if (state == ScanState::COMPLETED) {
        progress.progress_fraction = 1.0;
    } else if (duration > 0) {
        progress.progress_fraction = std::min(1.0, static_cast<double>(progress.elapsed_ms) /
                                                   static_cast<double>(duration));
    }
    return progress;
}

uint64_t DiscoveryCoordinator::ElapsedMs(const Session& session, ScanState state, uint64_t now) const {
    uint64_t finished = session.finished_at.load();
    if (finished != 0) {
        now = finished;
    }
    if (now <= session.started_at) {
        return 0;
    }

    uint64_t paused = session.paused_total_ms.load();
    uint64_t since = session.paused_since.load();
    if (state == ScanState::PAUSED && since != 0 && now > since) {
        paused += now - since;
    }

    uint64_t total = now - session.started_at;
    return total > paused ? total - paused : 0;
}

ScanCounters DiscoveryCoordinator::GetCounters() const {
    ScanCounters counters;
    counters.received = counters_.received.load();
    counters.accepted = counters_.accepted.load();
    counters.rejected = counters_.rejected.load();
    counters.suppressed = counters_.suppressed.load();
    counters.ignored = counters_.ignored.load();
    counters.buffered = counters_.buffered.load();
    counters.fields_dropped = counters_.fields_dropped.load();
    counters.anomalies = counters_.anomalies.load();
    counters.added = counters_.added.load();
    counters.updated = counters_.updated.load();
    counters.evicted = counters_.evicted.load();
    return counters;
}

std::vector<DeviceRecord> DiscoveryCoordinator::Snapshot() const {
    auto session = CurrentSession();
    if (!session) {
        return {};
    }
    return session->registry.All();
}

std::optional<DeviceRecord> DiscoveryCoordinator::GetDevice(const std::string& key) const {
    auto session = CurrentSession();
    if (!session) {
        return std::nullopt;
    }
    return session->registry.Get(key);
}

std::string DiscoveryCoordinator::GetSessionId() const {
    auto session = CurrentSession();
    return session ? session->id : "";
}

uint64_t DiscoveryCoordinator::GetStartedAt() const {
    auto session = CurrentSession();
    return session ? session->started_at : 0;
}

// --- Helpers ---

std::mutex& DiscoveryCoordinator::KeyLock(const std::string& key) {
    return key_locks_[std::hash<std::string>{}(key) % KEY_LOCK_STRIPES];
}

bool DiscoveryCoordinator::IsReentrant(const char* operation) const {
    if (t_delivering == this) {
        LOG_ERROR("{} called from an observer callback; ignored", operation);
        return true;
    }
    return false;
}

uint64_t DiscoveryCoordinator::SystemClock() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::optional<std::string> DiscoveryCoordinator::GenerateSessionId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        LOG_ERROR("Failed to generate session id: RAND_bytes failed");
        return std::nullopt;
    }

    // Set version 4 bits
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant bits
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    char uuid_str[37];
    std::snprintf(uuid_str, sizeof(uuid_str),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3],
        bytes[4], bytes[5], bytes[6], bytes[7],
        bytes[8], bytes[9], bytes[10], bytes[11],
        bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(uuid_str);
}

} // namespace homescout
