#pragma once

/**
 * @file executor.hpp
 * @brief Applies removal/installation methods to matched items
 *
 * Each origin owns an ordered list of methods. After every attempt the
 * executor asks a Verifier whether the entity reached the target state;
 * only a verified transition is a success. Independent items run on a
 * bounded worker pool.
 */

#include "sweep/types.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sweep {

// ============================================================================
// Methods
// ============================================================================

struct MethodResult {
    bool ok = false;     // the method reported no error
    std::string error;

    static MethodResult success() { return {true, {}}; }
    static MethodResult failure(std::string error) { return {false, std::move(error)}; }
};

using MethodFn = std::function<MethodResult(const InventoryItem&)>;

struct ActionMethod {
    std::string name;
    MethodFn run;
    // Methods sharing a lock group never run concurrently (e.g. "winget").
    // Empty: no serialization.
    std::string lock_group;
};

/**
 * Ordered method lists keyed by (origin, mode).
 */
class MethodTable {
public:
    void set(Origin origin, ActionMode mode, std::vector<ActionMethod> methods);
    void add(Origin origin, ActionMode mode, ActionMethod method);

    // Empty list if nothing is registered
    const std::vector<ActionMethod>& methods(Origin origin, ActionMode mode) const;

    // Every lock group referenced by any method
    std::set<std::string> lock_groups() const;

private:
    std::map<std::pair<Origin, ActionMode>, std::vector<ActionMethod>> table_;
};

// ============================================================================
// Verification
// ============================================================================

class Verifier {
public:
    virtual ~Verifier() = default;

    // Whether the entity is currently present. nullopt when the source of
    // truth could not be queried; that never counts as verified.
    virtual std::optional<bool> is_present(const InventoryItem& item, ActionMode mode) = 0;
};

// ============================================================================
// Cancellation
// ============================================================================

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// ============================================================================
// Action Executor
// ============================================================================

struct ExecutorOptions {
    size_t max_workers = 8;
    bool dry_run = false;
};

class ActionExecutor {
public:
    ActionExecutor(const MethodTable& methods,
                   Verifier& verifier,
                   ExecutorOptions options = {},
                   const CancellationToken* cancel = nullptr);

    ActionExecutor(const ActionExecutor&) = delete;
    ActionExecutor& operator=(const ActionExecutor&) = delete;

    // Drive one item through its method list. Never throws for a method
    // failure; the failure is recorded in the outcome.
    ActionOutcome execute(const MatchRecord& match, ActionMode mode);

    // Process every distinct item once, in parallel up to max_workers.
    // Outcomes are returned in the order of first appearance.
    std::vector<ActionOutcome> execute_all(const std::vector<MatchRecord>& matches, ActionMode mode);

private:
    // Holds the in-flight claim on every canonical identifier of one item
    class InFlightClaim {
    public:
        InFlightClaim(ActionExecutor& owner, std::set<std::string> ids);
        ~InFlightClaim();

        InFlightClaim(const InFlightClaim&) = delete;
        InFlightClaim& operator=(const InFlightClaim&) = delete;

    private:
        ActionExecutor& owner_;
        std::set<std::string> ids_;
    };

    std::mutex& lock_for(const std::string& group);

    const MethodTable& methods_;
    Verifier& verifier_;
    ExecutorOptions options_;
    const CancellationToken* cancel_;

    std::mutex in_flight_mutex_;
    std::condition_variable in_flight_cv_;
    std::set<std::string> in_flight_;

    std::mutex groups_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> group_locks_;
};

} // namespace sweep
