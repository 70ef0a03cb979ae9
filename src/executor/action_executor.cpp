#include "sweep/executor.hpp"
#include "sweep/identifier_set.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <unordered_set>

namespace sweep {

namespace asio = boost::asio;

// ============================================================================
// MethodTable
// ============================================================================

void MethodTable::set(Origin origin, ActionMode mode, std::vector<ActionMethod> methods) {
    table_[{origin, mode}] = std::move(methods);
}

void MethodTable::add(Origin origin, ActionMode mode, ActionMethod method) {
    table_[{origin, mode}].push_back(std::move(method));
}

const std::vector<ActionMethod>& MethodTable::methods(Origin origin, ActionMode mode) const {
    static const std::vector<ActionMethod> empty;
    auto it = table_.find({origin, mode});
    if (it == table_.end()) {
        return empty;
    }
    return it->second;
}

std::set<std::string> MethodTable::lock_groups() const {
    std::set<std::string> groups;
    for (const auto& entry : table_) {
        for (const auto& method : entry.second) {
            if (!method.lock_group.empty()) {
                groups.insert(method.lock_group);
            }
        }
    }
    return groups;
}

// ============================================================================
// ActionExecutor
// ============================================================================

namespace {

std::set<std::string> canonical_ids(const InventoryItem& item) {
    std::set<std::string> ids;
    for (const auto& id : item.identifiers()) {
        ids.insert(fold_case(id));
    }
    return ids;
}

std::string display_name(const InventoryItem& item) {
    auto ids = item.identifiers();
    return ids.empty() ? std::string("<unnamed>") : ids.front();
}

} // namespace

// All identifiers are claimed together, so two claims never deadlock
ActionExecutor::InFlightClaim::InFlightClaim(ActionExecutor& owner, std::set<std::string> ids)
    : owner_(owner), ids_(std::move(ids)) {
    std::unique_lock<std::mutex> lock(owner_.in_flight_mutex_);
    owner_.in_flight_cv_.wait(lock, [this] {
        for (const auto& id : ids_) {
            if (owner_.in_flight_.count(id) > 0) return false;
        }
        return true;
    });
    owner_.in_flight_.insert(ids_.begin(), ids_.end());
}

ActionExecutor::InFlightClaim::~InFlightClaim() {
    {
        std::lock_guard<std::mutex> lock(owner_.in_flight_mutex_);
        for (const auto& id : ids_) {
            owner_.in_flight_.erase(id);
        }
    }
    owner_.in_flight_cv_.notify_all();
}

ActionExecutor::ActionExecutor(const MethodTable& methods,
                               Verifier& verifier,
                               ExecutorOptions options,
                               const CancellationToken* cancel)
    : methods_(methods), verifier_(verifier), options_(options), cancel_(cancel) {
    if (options_.max_workers == 0) {
        options_.max_workers = 1;
    }
    for (const auto& group : methods_.lock_groups()) {
        group_locks_.emplace(group, std::make_unique<std::mutex>());
    }
}

std::mutex& ActionExecutor::lock_for(const std::string& group) {
    std::lock_guard<std::mutex> lock(groups_mutex_);
    auto& slot = group_locks_[group];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

ActionOutcome ActionExecutor::execute(const MatchRecord& match, ActionMode mode) {
    const InventoryItem& item = match.item;
    auto started = std::chrono::steady_clock::now();

    ActionOutcome outcome;
    outcome.item = item;

    auto finish = [&outcome, started]() {
        outcome.elapsed_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started).count();
        return outcome;
    };

    if (options_.dry_run) {
        outcome.status = OutcomeStatus::Skipped;
        outcome.method_used = "dry-run";
        return finish();
    }

    if (cancel_ && cancel_->is_cancelled()) {
        outcome.status = OutcomeStatus::Skipped;
        outcome.error = "cancelled";
        return finish();
    }

    const auto& methods = methods_.methods(item.origin, mode);
    if (methods.empty()) {
        outcome.status = OutcomeStatus::Failed;
        outcome.error = std::string("no ") + action_mode_to_string(mode) + " method for origin " +
                        origin_to_string(item.origin);
        return finish();
    }

    InFlightClaim claim(*this, canonical_ids(item));

    std::string name = display_name(item);
    std::string last_error;
    std::string last_ok_method;
    bool cancelled = false;

    for (const auto& method : methods) {
        if (cancel_ && cancel_->is_cancelled()) {
            cancelled = true;
            break;
        }

        MethodAttempt attempt;
        attempt.method = method.name;

        std::unique_lock<std::mutex> group_lock;
        if (!method.lock_group.empty()) {
            group_lock = std::unique_lock<std::mutex>(lock_for(method.lock_group));
        }

        spdlog::debug("{} {} via {}", action_mode_to_string(mode), name, method.name);

        MethodResult result;
        try {
            result = method.run(item);
        } catch (const std::exception& e) {
            result = MethodResult::failure(std::string("exception: ") + e.what());
        }

        attempt.reported_ok = result.ok;
        if (!result.ok) {
            attempt.error = result.error.empty() ? "method failed" : result.error;
            last_error = attempt.error;
        }

        std::optional<bool> present;
        try {
            present = verifier_.is_present(item, mode);
        } catch (const std::exception& e) {
            spdlog::warn("Verification of {} failed: {}", name, e.what());
        }

        if (group_lock.owns_lock()) {
            group_lock.unlock();
        }

        attempt.verified = present.has_value() &&
                           (mode == ActionMode::Remove ? !*present : *present);
        outcome.attempts.push_back(attempt);

        if (attempt.verified) {
            outcome.status = OutcomeStatus::Success;
            outcome.method_used = method.name;
            spdlog::info("{} {}: verified via {}", action_mode_to_string(mode), name, method.name);
            return finish();
        }

        if (result.ok) {
            last_ok_method = method.name;
            spdlog::debug("{} reported success for {} but the effect was not verified", method.name, name);
        } else {
            spdlog::debug("{} failed for {}: {}", method.name, name, attempt.error);
        }
    }

    if (!last_ok_method.empty()) {
        outcome.status = OutcomeStatus::Partial;
        outcome.method_used = last_ok_method;
        outcome.error = cancelled ? "cancelled before remaining methods"
                                  : "effect not verified after " + std::to_string(outcome.attempts.size()) +
                                        " method(s)";
    } else if (outcome.attempts.empty()) {
        outcome.status = OutcomeStatus::Skipped;
        outcome.error = "cancelled";
    } else {
        outcome.status = OutcomeStatus::Failed;
        outcome.error = cancelled ? last_error + " (cancelled before remaining methods)" : last_error;
    }

    spdlog::info("{} {}: {}{}", action_mode_to_string(mode), name,
                 outcome_status_to_string(outcome.status),
                 outcome.error ? " (" + *outcome.error + ")" : std::string());
    return finish();
}

std::vector<ActionOutcome> ActionExecutor::execute_all(const std::vector<MatchRecord>& matches,
                                                       ActionMode mode) {
    // Each distinct item is processed at most once
    std::vector<const MatchRecord*> unique;
    std::unordered_set<std::string> seen;
    for (const auto& m : matches) {
        if (seen.insert(m.item.key()).second) {
            unique.push_back(&m);
        }
    }

    std::vector<ActionOutcome> outcomes(unique.size());
    if (unique.empty()) {
        return outcomes;
    }

    size_t workers = std::min(options_.max_workers, unique.size());
    asio::thread_pool pool(workers);

    for (size_t i = 0; i < unique.size(); ++i) {
        asio::post(pool, [this, &outcomes, &unique, i, mode]() {
            outcomes[i] = execute(*unique[i], mode);
        });
    }

    pool.join();
    return outcomes;
}

} // namespace sweep
