#pragma once

#include "bgd/error_handling.hpp"
#include "bgd/types.hpp"
#include <string>

namespace bgd {

// Durable copy of a run's progress. Survives a crash of the orchestrator so
// an operator can tell whether traffic was moved and not restored.
struct JournalEntry {
    std::string deployment_id;
    DeploymentState state{DeploymentState::VALIDATING};
    bool switch_occurred{false};
    std::string previous_target;
    std::string new_target;
    std::string image_tag;
    std::string started_at;
    std::string updated_at;
    int pid{0};

    // Traffic was moved, or may have been, and the run did not finish cleanly.
    bool rollback_required() const;
};

class RunJournal {
public:
    RunJournal(std::string dir, const std::string& env_a, const std::string& env_b);

    static std::string path_for(const std::string& dir, const std::string& env_a,
                                const std::string& env_b);

    const std::string& path() const { return path_; }

    // Replace the journal atomically: write temp file, fsync, rename, fsync dir.
    Result<void> write(const JournalEntry& entry) const;

    // JOURNAL_READ_FAILED with detail "missing" when no journal exists.
    Result<JournalEntry> read() const;
    bool exists() const;

    static std::string serialize(const JournalEntry& entry);
    static Result<JournalEntry> parse(const std::string& content);

private:
    std::string dir_;
    std::string path_;
};

} // namespace bgd
