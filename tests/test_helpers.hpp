/**
 * Shared fixtures for sweep tests: temporary directories and scripted
 * stand-ins for inventory sources, command runners and verifiers.
 */

#pragma once

#include <sweep/sweep.hpp>

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace sweep::test {

// Helper to create temporary test directory
class TempTestDir {
public:
    TempTestDir() {
        std::random_device rd;
        std::string unique_name = "sweep_test_" + std::to_string(std::time(nullptr)) + "_" +
                                  std::to_string(rd());
        path = (std::filesystem::temp_directory_path() / unique_name).string();
        std::filesystem::create_directories(path);
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    }

    TempTestDir(const TempTestDir&) = delete;
    TempTestDir& operator=(const TempTestDir&) = delete;

    std::string file(const std::string& name) const {
        return (std::filesystem::path(path) / name).string();
    }

    std::string path;
};

inline RawRecord record(Origin origin, std::map<std::string, std::string> fields) {
    RawRecord r;
    r.origin = origin;
    r.fields = std::move(fields);
    return r;
}

inline InventoryItem item(const std::string& name, Origin origin = Origin::OSPackage,
                          std::set<std::string> alternates = {}) {
    InventoryItem i;
    i.primary_name = name;
    i.origin = origin;
    i.alternate_identifiers = std::move(alternates);
    return i;
}

inline MatchRecord match_for(const InventoryItem& i, const std::string& pattern = "") {
    MatchRecord m;
    m.pattern = pattern.empty() ? i.primary_name : pattern;
    m.item = i;
    m.strategy = MatchStrategy::Exact;
    m.matched_identifier = i.primary_name;
    return m;
}

/**
 * In-memory inventory source. Records can be changed while a run is in
 * progress (e.g. by a fake removal method).
 */
class FakeSource : public InventorySource {
public:
    FakeSource(std::string name, Origin origin, std::vector<RawRecord> records = {})
        : name_(std::move(name)), origin_(origin), records_(std::move(records)) {}

    const std::string& name() const override { return name_; }
    Origin origin() const override { return origin_; }

    CollectResult collect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        CollectResult result;
        if (!available_) {
            result.error = "unavailable";
            return result;
        }
        result.ok = true;
        result.records = records_;
        return result;
    }

    void set_available(bool available) {
        std::lock_guard<std::mutex> lock(mutex_);
        available_ = available;
    }

    void add(std::map<std::string, std::string> fields) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record(origin_, std::move(fields)));
    }

    // Drop every record with a field equal to `value`
    void remove_where(const std::string& field, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RawRecord> kept;
        for (auto& r : records_) {
            auto it = r.fields.find(field);
            if (it == r.fields.end() || it->second != value) {
                kept.push_back(std::move(r));
            }
        }
        records_ = std::move(kept);
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::string name_;
    Origin origin_;
    std::vector<RawRecord> records_;
    bool available_ = true;
    size_t calls_ = 0;
    mutable std::mutex mutex_;
};

/**
 * Command runner that answers from a handler and records every call.
 */
class ScriptedRunner : public CommandRunner {
public:
    using Handler = std::function<CommandResult(const CommandSpec&)>;

    explicit ScriptedRunner(Handler handler = nullptr) : handler_(std::move(handler)) {}

    static CommandResult exit_with(int code, const std::string& out = "", const std::string& err = "") {
        CommandResult r;
        r.ok = true;
        r.exit_code = code;
        r.stdout_text = out;
        r.stderr_text = err;
        return r;
    }

    CommandResult run(const CommandSpec& spec) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(spec);
        }
        if (!handler_) {
            return exit_with(0);
        }
        return handler_(spec);
    }

    std::vector<CommandSpec> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    Handler handler_;
    std::vector<CommandSpec> calls_;
    mutable std::mutex mutex_;
};

class FakeVerifier : public Verifier {
public:
    using Fn = std::function<std::optional<bool>(const InventoryItem&, ActionMode)>;

    explicit FakeVerifier(Fn fn) : fn_(std::move(fn)) {}

    std::optional<bool> is_present(const InventoryItem& item, ActionMode mode) override {
        return fn_(item, mode);
    }

private:
    Fn fn_;
};

} // namespace sweep::test
