#include "bgd/run_journal.hpp"
#include "bgd/deployment_lock.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace bgd {

namespace {

Result<void> write_fully(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void>(ErrorCode::JOURNAL_WRITE_FAILED, std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
    return Result<void>();
}

} // namespace

bool JournalEntry::rollback_required() const {
    if (switch_occurred) return state != DeploymentState::COMPLETED;

    // The flag is recorded after set_target returns. A run that died inside
    // the call left the router in an unknown position.
    return state == DeploymentState::SWITCHING ||
           state == DeploymentState::VALIDATING_SWITCH ||
           state == DeploymentState::ROLLING_BACK;
}

RunJournal::RunJournal(std::string dir, const std::string& env_a, const std::string& env_b)
    : dir_(std::move(dir)), path_(path_for(dir_, env_a, env_b)) {}

std::string RunJournal::path_for(const std::string& dir, const std::string& env_a,
                                 const std::string& env_b) {
    return dir + "/" + pair_key(env_a, env_b) + ".journal";
}

std::string RunJournal::serialize(const JournalEntry& entry) {
    std::ostringstream out;
    out << "deployment_id=" << entry.deployment_id << "\n"
        << "state=" << to_string(entry.state) << "\n"
        << "switch_occurred=" << (entry.switch_occurred ? "true" : "false") << "\n"
        << "previous_target=" << entry.previous_target << "\n"
        << "new_target=" << entry.new_target << "\n"
        << "image_tag=" << entry.image_tag << "\n"
        << "started_at=" << entry.started_at << "\n"
        << "updated_at=" << entry.updated_at << "\n"
        << "pid=" << entry.pid << "\n";
    return out.str();
}

Result<JournalEntry> RunJournal::parse(const std::string& content) {
    JournalEntry entry;
    bool has_id = false;
    bool has_state = false;
    bool has_flag = false;

    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            return Result<JournalEntry>(ErrorCode::JOURNAL_READ_FAILED, "malformed line: " + line);
        }
        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);

        if (key == "deployment_id") {
            entry.deployment_id = value;
            has_id = true;
        } else if (key == "state") {
            if (!parse_deployment_state(value, entry.state)) {
                return Result<JournalEntry>(ErrorCode::JOURNAL_READ_FAILED, "unknown state: " + value);
            }
            has_state = true;
        } else if (key == "switch_occurred") {
            if (value != "true" && value != "false") {
                return Result<JournalEntry>(ErrorCode::JOURNAL_READ_FAILED, "bad switch_occurred: " + value);
            }
            entry.switch_occurred = value == "true";
            has_flag = true;
        } else if (key == "previous_target") {
            entry.previous_target = value;
        } else if (key == "new_target") {
            entry.new_target = value;
        } else if (key == "image_tag") {
            entry.image_tag = value;
        } else if (key == "started_at") {
            entry.started_at = value;
        } else if (key == "updated_at") {
            entry.updated_at = value;
        } else if (key == "pid") {
            try {
                entry.pid = std::stoi(value);
            } catch (const std::exception&) {
                return Result<JournalEntry>(ErrorCode::JOURNAL_READ_FAILED, "bad pid: " + value);
            }
        }
        // unknown keys are ignored so older binaries can read newer journals
    }

    if (!has_id || !has_state || !has_flag) {
        return Result<JournalEntry>(ErrorCode::JOURNAL_READ_FAILED, "incomplete journal");
    }
    return entry;
}

Result<void> RunJournal::write(const JournalEntry& entry) const {
    std::string tmp_path = path_ + ".tmp";
    std::string content = serialize(entry);

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result<void>(ErrorCode::JOURNAL_WRITE_FAILED, tmp_path + ": " + std::strerror(errno));
    }

    auto written = write_fully(fd, content);
    if (written.has_error()) {
        ::close(fd);
        ::unlink(tmp_path.c_str());
        return written;
    }
    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        ::unlink(tmp_path.c_str());
        return Result<void>(ErrorCode::JOURNAL_WRITE_FAILED, "fsync: " + std::string(std::strerror(saved)));
    }
    ::close(fd);

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        int saved = errno;
        ::unlink(tmp_path.c_str());
        return Result<void>(ErrorCode::JOURNAL_WRITE_FAILED, "rename: " + std::string(std::strerror(saved)));
    }

    // Persist the rename itself.
    int dir_fd = ::open(dir_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0) {
        ::fsync(dir_fd);
        ::close(dir_fd);
    }
    return Result<void>();
}

bool RunJournal::exists() const {
    struct stat st{};
    return ::stat(path_.c_str(), &st) == 0;
}

Result<JournalEntry> RunJournal::read() const {
    std::ifstream file(path_);
    if (!file) {
        return Result<JournalEntry>(ErrorCode::JOURNAL_READ_FAILED, exists() ? path_ : "missing");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

} // namespace bgd
