/**
 * @file cleanup_stack.hpp
 * @brief Scoped record of acquired resources, released in reverse order
 *
 * Every step that creates something pushes the action that undoes it. On
 * success the stack is committed and nothing runs; on failure (explicit
 * Unwind() or destruction) the actions run last-in first-out. A failing
 * action does not stop the remaining ones.
 *
 * @date 2025
 */

#pragma once

#include <spdlog/spdlog.h>

#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace sandcell {
namespace core {

class CleanupStack {
public:
    CleanupStack() = default;
    ~CleanupStack() { Unwind(); }

    CleanupStack(const CleanupStack&) = delete;
    CleanupStack& operator=(const CleanupStack&) = delete;

    /**
     * @brief Record a release action
     * @param description Human-readable name used in logs and failure reports
     * @param release Action undoing the acquisition
     */
    void Push(std::string description, std::function<void()> release) {
        entries_.push_back(Entry{std::move(description), std::move(release)});
    }

    /**
     * @brief Keep everything acquired so far; no action will run
     */
    void Commit() { entries_.clear(); }

    /**
     * @brief Run all pending actions in reverse order
     * @return Descriptions of actions that threw, with their messages
     */
    std::vector<std::string> Unwind() {
        std::vector<std::string> failures;
        while (!entries_.empty()) {
            Entry entry = std::move(entries_.back());
            entries_.pop_back();
            try {
                spdlog::debug("Rollback: {}", entry.description);
                entry.release();
            }
            catch (const std::exception& e) {
                spdlog::warn("Rollback step '{}' failed: {}", entry.description, e.what());
                failures.push_back(entry.description + ": " + e.what());
            }
        }
        return failures;
    }

    bool Empty() const { return entries_.empty(); }
    std::size_t Size() const { return entries_.size(); }

private:
    struct Entry {
        std::string description;
        std::function<void()> release;
    };

    std::vector<Entry> entries_;
};

} // namespace core
} // namespace sandcell
