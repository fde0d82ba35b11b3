#pragma once

#include "bgd/error_handling.hpp"
#include "bgd/run_state.hpp"
#include "bgd/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bgd {

// Write-once summary of a finished run.
struct DeploymentReport {
    std::string deployment_id;
    std::string operator_name;
    std::string image_tag;
    std::string previous_active;
    std::string candidate;
    std::string active_after;   // empty when the final routing is unknown

    TimePoint requested_at;
    TimePoint finished_at;
    std::chrono::milliseconds duration{0};

    DeploymentState final_state{DeploymentState::FAILED};
    std::optional<DeploymentState> failed_stage;
    ErrorCode error{ErrorCode::SUCCESS};
    ErrorClass error_class{ErrorClass::NONE};
    std::string error_name;
    std::string error_detail;
    bool cancelled{false};

    bool rollback_attempted{false};
    bool rollback_succeeded{false};
    std::optional<RollbackRecord> rollback;

    std::vector<StageRecord> stages;
    std::vector<ProbeResult> health_probes;
    std::vector<ProbeResult> switch_probes;
    std::optional<SmokeTestResult> smoke;

    std::string rollback_instructions;
    std::string log_file;

    bool succeeded() const { return final_state == DeploymentState::COMPLETED; }
};

// Pure assembly and rendering; persistence belongs to a ReportSink.
class Reporter {
public:
    static DeploymentReport assemble(const RunState& run, const std::string& log_file = "");

    static std::string render_markdown(const DeploymentReport& report);
    static std::string render_json(const DeploymentReport& report);

    // Operator-facing outcome: failed stage and what happened to traffic.
    static std::string summary(const DeploymentReport& report);
};

class ReportSink {
public:
    virtual ~ReportSink() = default;
    virtual Result<void> write(const DeploymentReport& report) = 0;
};

// <dir>/bgd_deployment_report_<id>.md and .json. The JSON record carries a
// SHA-256 digest of the Markdown report and, with a signing key, an
// HMAC-SHA256 over it.
class FileReportSink : public ReportSink {
public:
    FileReportSink(std::string dir, std::string signing_key);

    Result<void> write(const DeploymentReport& report) override;

    std::string markdown_path(const std::string& deployment_id) const;
    std::string json_path(const std::string& deployment_id) const;

private:
    std::string dir_;
    std::string signing_key_;
};

std::string json_escape(const std::string& text);

} // namespace bgd
