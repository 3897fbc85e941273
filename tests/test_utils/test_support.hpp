#pragma once

// In-memory stand-ins for the shared store, the lock server, the jobs table
// and the alert channel, plus the assertion macro used by every test binary.

#include "syncgate/clock.hpp"
#include "syncgate/failure_notifier.hpp"
#include "syncgate/job_repository.hpp"
#include "syncgate/lock_provider.hpp"
#include "syncgate/state_store.hpp"
#include <algorithm>
#include <deque>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#define TEST_ASSERT(condition, message) \
    if (!(condition)) { \
        std::cerr << "❌ TEST FAILED: " << message << std::endl; \
        return false; \
    } else { \
        std::cout << "✅ " << message << std::endl; \
    }

namespace syncgate {
namespace testing {

class ManualClock : public Clock {
private:
    int64_t now_;

public:
    explicit ManualClock(int64_t start = 1700000000) : now_(start) {}

    int64_t now() const override { return now_; }
    void advance(int64_t seconds) { now_ += seconds; }
    void set(int64_t epoch_seconds) { now_ = epoch_seconds; }
};

// Honors TTLs against the injected clock, like the real store does against NOW()
class MemoryStateStore : public StateStore {
private:
    struct Entry {
        std::string value;
        int64_t expires_at = 0;   // 0 = never
    };

    std::shared_ptr<Clock> clock_;
    std::map<std::string, Entry> entries_;

    bool live(const Entry& entry) const {
        return entry.expires_at == 0 || entry.expires_at > clock_->now();
    }

    int64_t expiry(int ttl_seconds) const {
        return ttl_seconds > 0 ? clock_->now() + ttl_seconds : 0;
    }

    void check_failure() const {
        if (fail) throw std::runtime_error("state store unavailable");
    }

public:
    bool fail = false;

    explicit MemoryStateStore(std::shared_ptr<Clock> clock) : clock_(clock) {}

    std::optional<std::string> get(const std::string& key) override {
        check_failure();
        auto it = entries_.find(key);
        if (it == entries_.end() || !live(it->second)) return std::nullopt;
        return it->second.value;
    }

    void put(const std::string& key, const std::string& value, int ttl_seconds) override {
        check_failure();
        entries_[key] = Entry{value, expiry(ttl_seconds)};
    }

    bool add(const std::string& key, const std::string& value, int ttl_seconds) override {
        check_failure();
        auto it = entries_.find(key);
        if (it != entries_.end() && live(it->second)) return false;
        entries_[key] = Entry{value, expiry(ttl_seconds)};
        return true;
    }

    int64_t increment_by(const std::string& key, int64_t amount, int ttl_seconds) override {
        check_failure();
        int64_t current = 0;
        auto it = entries_.find(key);
        if (it != entries_.end() && live(it->second)) {
            try {
                current = std::stoll(it->second.value);
            } catch (const std::exception&) {
                current = 0;
            }
        }
        entries_[key] = Entry{std::to_string(current + amount), expiry(ttl_seconds)};
        return current + amount;
    }

    void remove(const std::string& key) override {
        check_failure();
        entries_.erase(key);
    }

    bool contains(const std::string& key) {
        return get(key).has_value();
    }
};

// Answers from a script first; with an empty script it behaves like a real
// lock server (a name held by anyone is Denied)
class ScriptedLockProvider : public LockProvider {
private:
    std::deque<LockSignal> script_;
    std::set<std::string> held_;

public:
    int acquire_calls = 0;
    int release_calls = 0;
    int last_timeout = -1;

    void script(std::initializer_list<LockSignal> signals) {
        script_.insert(script_.end(), signals.begin(), signals.end());
    }

    LockSignal acquire(const std::string& name, int timeout_seconds) override {
        ++acquire_calls;
        last_timeout = timeout_seconds;

        LockSignal signal;
        if (!script_.empty()) {
            signal = script_.front();
            script_.pop_front();
        } else {
            signal = held_.count(name) ? LockSignal::Denied : LockSignal::Acquired;
        }

        if (signal == LockSignal::Acquired) {
            held_.insert(name);
        }
        return signal;
    }

    void release(const std::string& name) override {
        ++release_calls;
        held_.erase(name);
    }

    bool is_held(const std::string& name) const { return held_.count(name) > 0; }

    // Simulates another process owning the lock
    void hold_elsewhere(const std::string& name) { held_.insert(name); }
};

class RecordingTransport : public NotificationTransport {
public:
    struct Message {
        std::string recipient;
        std::string subject;
        std::string body;
    };

    std::vector<Message> sent;
    bool succeed = true;

    bool send(const std::string& recipient,
              const std::string& subject,
              const std::string& body) override {
        if (!succeed) return false;
        sent.push_back(Message{recipient, subject, body});
        return true;
    }
};

// Mirrors the SQL of PgJobRepository over a vector
class MemoryJobRepository : public JobRepository {
private:
    std::shared_ptr<Clock> clock_;
    std::vector<Job> jobs_;
    int64_t next_id_ = 1;

    static bool queue_order(const Job& a, const Job& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    }

    Job* lookup(int64_t id) {
        for (auto& job : jobs_) {
            if (job.id == id) return &job;
        }
        return nullptr;
    }

public:
    explicit MemoryJobRepository(std::shared_ptr<Clock> clock) : clock_(clock) {}

    int64_t insert(const Job& job) override {
        Job row = job;
        row.id = next_id_++;
        row.status = JobStatus::Pending;
        row.attempts = 0;
        row.created_at = format_utc(clock_->now());
        jobs_.push_back(row);
        return row.id;
    }

    std::optional<int64_t> find_pending_duplicate(const Job& job) override {
        for (const auto& row : jobs_) {
            if (row.status != JobStatus::Pending || row.module != job.module ||
                row.entity_type != job.entity_type || row.direction != job.direction) {
                continue;
            }
            if (job.wp_id > 0 && row.wp_id != job.wp_id) continue;
            if (job.wp_id <= 0 && job.odoo_id > 0 && row.odoo_id != job.odoo_id) continue;
            return row.id;
        }
        return std::nullopt;
    }

    bool update_pending(int64_t id, const Job& job) override {
        Job* row = lookup(id);
        if (!row || row->status != JobStatus::Pending) return false;
        row->action = job.action;
        row->payload = job.payload;
        row->priority = job.priority;
        return true;
    }

    bool delete_pending(int64_t id) override {
        auto it = std::find_if(jobs_.begin(), jobs_.end(), [id](const Job& job) {
            return job.id == id && job.status == JobStatus::Pending;
        });
        if (it == jobs_.end()) return false;
        jobs_.erase(it);
        return true;
    }

    std::optional<Job> find(int64_t id) override {
        Job* row = lookup(id);
        if (!row) return std::nullopt;
        return *row;
    }

    std::vector<Job> select_pending(const std::optional<std::string>& module,
                                    const std::optional<std::string>& entity_type) override {
        std::vector<Job> out;
        for (const auto& job : jobs_) {
            if (job.status != JobStatus::Pending) continue;
            if (module && job.module != *module) continue;
            if (entity_type && job.entity_type != *entity_type) continue;
            out.push_back(job);
        }
        std::sort(out.begin(), out.end(), queue_order);
        return out;
    }

    std::vector<Job> select_ready(int limit, const std::string& now) override {
        std::vector<Job> out;
        for (const auto& job : jobs_) {
            if (job.status != JobStatus::Pending) continue;
            if (job.scheduled_at && *job.scheduled_at > now) continue;
            out.push_back(job);
        }
        std::sort(out.begin(), out.end(), queue_order);
        if (static_cast<int>(out.size()) > limit) out.resize(limit);
        return out;
    }

    bool update_status(int64_t id, JobStatus status, const JobUpdate& update) override {
        Job* row = lookup(id);
        if (!row) return false;
        if (is_terminal(row->status)) return false;

        row->status = status;
        if (update.attempts) row->attempts = *update.attempts;
        if (update.error_message) {
            row->error_message = update.error_message->empty()
                ? std::nullopt : std::optional<std::string>(*update.error_message);
        }
        if (update.scheduled_at) {
            row->scheduled_at = update.scheduled_at->empty()
                ? std::nullopt : std::optional<std::string>(*update.scheduled_at);
        }
        if (update.processed_at) {
            row->processed_at = update.processed_at->empty()
                ? std::nullopt : std::optional<std::string>(*update.processed_at);
        }
        return true;
    }

    QueueStats stats() override {
        QueueStats stats;
        for (const auto& job : jobs_) {
            ++stats.total;
            switch (job.status) {
                case JobStatus::Pending: ++stats.pending; break;
                case JobStatus::Processing: ++stats.processing; break;
                case JobStatus::Done: ++stats.done; break;
                case JobStatus::Failed: ++stats.failed; break;
                case JobStatus::Cancelled: ++stats.cancelled; break;
            }
            if (job.processed_at &&
                (!stats.last_processed_at || *job.processed_at > *stats.last_processed_at)) {
                stats.last_processed_at = job.processed_at;
            }
        }
        return stats;
    }

    QueueHealth health() override {
        QueueHealth health;
        int64_t done = 0;
        int64_t failed = 0;
        int64_t timed = 0;
        double latency_total = 0.0;
        for (const auto& job : jobs_) {
            if (job.status == JobStatus::Pending) {
                ++health.depth_by_module[job.module];
            } else if (job.status == JobStatus::Failed) {
                ++failed;
            } else if (job.status == JobStatus::Done) {
                ++done;
                auto created = parse_utc(job.created_at);
                auto processed = job.processed_at ? parse_utc(*job.processed_at) : std::nullopt;
                if (created && processed) {
                    latency_total += static_cast<double>(*processed - *created);
                    ++timed;
                }
            }
        }
        if (timed > 0) health.avg_latency_seconds = latency_total / static_cast<double>(timed);
        if (done + failed > 0) {
            health.success_rate = 100.0 * static_cast<double>(done) / static_cast<double>(done + failed);
        }
        return health;
    }

    int reset_failed() override {
        int count = 0;
        for (auto& job : jobs_) {
            if (job.status != JobStatus::Failed) continue;
            job.status = JobStatus::Pending;
            job.attempts = 0;
            job.error_message.reset();
            job.scheduled_at.reset();
            ++count;
        }
        return count;
    }

    int delete_finished_before(const std::string& cutoff) override {
        auto before = jobs_.size();
        jobs_.erase(std::remove_if(jobs_.begin(), jobs_.end(), [&cutoff](const Job& job) {
            return (job.status == JobStatus::Done || job.status == JobStatus::Failed) &&
                   job.created_at < cutoff;
        }), jobs_.end());
        return static_cast<int>(before - jobs_.size());
    }

    size_t size() const { return jobs_.size(); }
};

} // namespace testing
} // namespace syncgate
