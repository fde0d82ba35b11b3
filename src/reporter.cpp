/**
 * @file reporter.cpp
 * @brief Deployment report assembly, rendering and file sink
 *
 * The report is derived from the finished RunState and never mutated after
 * assembly. Markdown is for the operator, JSON for audit tooling.
 */

#include "bgd/reporter.hpp"
#include "bgd/clock.hpp"
#include "bgd/logger.hpp"
#include "bgd/security_utils.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace bgd {

namespace {

std::string seconds_text(std::chrono::milliseconds duration) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << static_cast<double>(duration.count()) / 1000.0 << "s";
    return ss.str();
}

std::string table_cell(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (c == '|') out += "\\|";
        else if (c == '\n' || c == '\r') out += ' ';
        else out += c;
    }
    return out;
}

std::string quoted(const std::string& text) {
    return "\"" + json_escape(text) + "\"";
}

void probes_table(std::ostringstream& md, const std::vector<ProbeResult>& probes) {
    if (probes.empty()) {
        md << "_No probes were run._\n\n";
        return;
    }
    md << "| Attempt | Time | Result | Latency | Detail |\n"
       << "|---|---|---|---|---|\n";
    for (const auto& probe : probes) {
        md << "| " << probe.attempt
           << " | " << format_timestamp(probe.timestamp)
           << " | " << (probe.success ? "pass" : "fail")
           << " | " << probe.latency.count() << "ms"
           << " | " << table_cell(probe.detail) << " |\n";
    }
    md << "\n";
}

void probes_json(std::ostringstream& js, const std::vector<ProbeResult>& probes) {
    js << "[";
    for (size_t i = 0; i < probes.size(); ++i) {
        const auto& probe = probes[i];
        if (i > 0) js << ",";
        js << "{\"attempt\":" << probe.attempt
           << ",\"timestamp\":" << quoted(format_timestamp(probe.timestamp))
           << ",\"success\":" << (probe.success ? "true" : "false")
           << ",\"latency_ms\":" << probe.latency.count()
           << ",\"detail\":" << quoted(probe.detail) << "}";
    }
    js << "]";
}

// Creates path exclusively: an existing report is never replaced.
Result<void> write_file(const std::string& path, const std::string& content) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return Result<void>(ErrorCode::REPORT_WRITE_FAILED, path + " already exists");
        }
        return Result<void>(ErrorCode::REPORT_WRITE_FAILED, path + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string error = std::strerror(errno);
            ::close(fd);
            return Result<void>(ErrorCode::REPORT_WRITE_FAILED, path + ": " + error);
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        return Result<void>(ErrorCode::REPORT_WRITE_FAILED, path + ": " + std::strerror(errno));
    }
    return Result<void>();
}

} // namespace

std::string json_escape(const std::string& text) {
    std::ostringstream out;
    for (unsigned char c : text) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            default:
                if (c < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec << std::setfill(' ');
                } else {
                    out << static_cast<char>(c);
                }
        }
    }
    return out.str();
}

DeploymentReport Reporter::assemble(const RunState& run, const std::string& log_file) {
    const auto& request = run.request();

    DeploymentReport report;
    report.deployment_id = request.deployment_id;
    report.operator_name = request.operator_name;
    report.image_tag = request.image_tag;
    report.previous_active = request.active.name;
    report.candidate = request.inactive.name;
    report.requested_at = request.requested_at;
    report.finished_at = run.finished_at();
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        report.finished_at - report.requested_at);
    if (report.duration.count() < 0) report.duration = std::chrono::milliseconds(0);

    report.final_state = run.state();
    report.failed_stage = run.failed_stage();
    report.error = run.error();
    report.error_detail = run.error_detail();
    report.cancelled = run.cancelled();

    report.rollback = run.rollback();
    report.rollback_attempted = report.rollback.has_value();
    report.rollback_succeeded = report.rollback_attempted && report.rollback->succeeded;

    if (report.rollback_attempted && !report.rollback_succeeded) {
        report.error_class = ErrorClass::ROLLBACK;
        report.error_name = taxonomy_name(ErrorCode::ROLLBACK_FAILED);
    } else {
        report.error_class = classify(report.error);
        report.error_name = taxonomy_name(report.error);
    }

    if (report.succeeded()) {
        report.active_after = report.candidate;
    } else if (!run.switch_occurred()) {
        report.active_after = report.previous_active;
    }

    report.stages = run.stages();
    report.health_probes = run.health_probes();
    report.switch_probes = run.switch_probes();
    report.smoke = run.smoke_result();
    report.log_file = log_file;

    if (report.succeeded()) {
        report.rollback_instructions =
            report.previous_active + " still runs the previous release. To return traffic to it, run: "
            "bgd-deploy " + report.candidate + " " + report.previous_active + " <previous image tag>, "
            "or repoint the traffic switch at " + report.previous_active + " directly.";
    } else if (report.active_after.empty()) {
        report.rollback_instructions =
            "Traffic routing is UNKNOWN. Repoint the traffic switch at " + report.previous_active +
            " by hand and confirm the public endpoint serves it before clearing the journal.";
    } else {
        report.rollback_instructions =
            "No action required: " + report.previous_active + " still serves traffic.";
    }

    return report;
}

std::string Reporter::summary(const DeploymentReport& report) {
    if (report.succeeded()) {
        return "Deployment " + report.deployment_id + " COMPLETED: " + report.image_tag +
               " is live on " + report.candidate + " (previously " + report.previous_active + ")";
    }

    std::string stage = report.failed_stage ? to_string(*report.failed_stage) : "UNKNOWN";
    std::string text = "Deployment " + report.deployment_id + " FAILED at " + stage +
                       " (" + report.error_name + (report.cancelled ? ", cancelled" : "") + ")";
    if (!report.error_detail.empty()) {
        text += ": " + report.error_detail;
    }
    text += ". ";

    if (!report.rollback_attempted) {
        text += "Rollback not attempted; " + report.previous_active + " still serves traffic.";
    } else if (report.rollback_succeeded) {
        text += "Rollback attempted and succeeded; traffic restored to " + report.previous_active + ".";
    } else {
        text += "Rollback attempted and FAILED; manual intervention required. " + report.rollback_instructions;
    }
    return text;
}

std::string Reporter::render_markdown(const DeploymentReport& report) {
    std::ostringstream md;

    md << "# Blue/Green Deployment Report\n\n"
       << "## Deployment Summary\n\n"
       << "- **Deployment ID:** " << report.deployment_id << "\n"
       << "- **Operator:** " << report.operator_name << "\n"
       << "- **Requested:** " << format_timestamp(report.requested_at) << "\n"
       << "- **Finished:** " << format_timestamp(report.finished_at) << "\n"
       << "- **Duration:** " << seconds_text(report.duration) << "\n"
       << "- **Image tag:** " << report.image_tag << "\n"
       << "- **Previous active environment:** " << report.previous_active << "\n"
       << "- **Candidate environment:** " << report.candidate << "\n"
       << "- **Active environment after run:** "
       << (report.active_after.empty() ? "UNKNOWN" : report.active_after) << "\n"
       << "- **Final state:** " << to_string(report.final_state) << "\n\n"
       << "**Outcome:** " << summary(report) << "\n\n";

    if (!report.succeeded()) {
        md << "## Failure\n\n"
           << "- **Failed stage:** " << (report.failed_stage ? to_string(*report.failed_stage) : "UNKNOWN") << "\n"
           << "- **Error class:** " << to_string(report.error_class) << " (" << report.error_name << ")\n"
           << "- **Error:** " << make_error_code(report.error).message() << "\n";
        if (!report.error_detail.empty()) {
            md << "- **Detail:** " << table_cell(report.error_detail) << "\n";
        }
        if (report.cancelled) {
            md << "- **Cancelled by operator signal**\n";
        }
        md << "\n";
    }

    md << "## Stages\n\n";
    if (report.stages.empty()) {
        md << "_No stages ran._\n\n";
    } else {
        md << "| Stage | Result | Started | Duration | Detail |\n"
           << "|---|---|---|---|---|\n";
        for (const auto& stage : report.stages) {
            md << "| " << to_string(stage.stage)
               << " | " << (stage.passed ? "pass" : "fail")
               << " | " << format_timestamp(stage.started_at)
               << " | " << seconds_text(stage.duration)
               << " | " << table_cell(stage.detail) << " |\n";
        }
        md << "\n";
    }

    md << "## Health Checks (candidate, internal endpoint)\n\n";
    probes_table(md, report.health_probes);

    md << "## Smoke Tests\n\n";
    if (report.smoke) {
        md << "- **Result:** " << (report.smoke->passed ? "pass" : "fail")
           << (report.smoke->timed_out ? " (timed out)" : "") << "\n"
           << "- **Duration:** " << seconds_text(report.smoke->duration) << "\n";
        if (!report.smoke->failed_check.empty()) {
            md << "- **Failed check:** " << report.smoke->failed_check << "\n";
        }
        md << "\n```\n" << report.smoke->output << "```\n\n";
    } else {
        md << "_Smoke tests did not run._\n\n";
    }

    md << "## Traffic Validation (public endpoint)\n\n";
    probes_table(md, report.switch_probes);

    md << "## Rollback\n\n";
    if (report.rollback) {
        const auto& rb = *report.rollback;
        md << "- **Triggered by:** " << to_string(rb.triggering_stage) << "\n"
           << "- **Reason:** " << table_cell(rb.reason) << "\n"
           << "- **Started:** " << format_timestamp(rb.started_at) << "\n"
           << "- **Completed:** " << format_timestamp(rb.completed_at) << "\n"
           << "- **Succeeded:** " << (rb.succeeded ? "yes" : "NO") << "\n\n";
    } else {
        md << "_Rollback was not attempted._\n\n";
    }

    md << "## Rollback Instructions\n\n" << report.rollback_instructions << "\n\n";

    if (!report.log_file.empty()) {
        md << "## Log File\n\n`" << report.log_file << "`\n";
    }

    return md.str();
}

std::string Reporter::render_json(const DeploymentReport& report) {
    std::ostringstream js;

    js << "{\"deployment_id\":" << quoted(report.deployment_id)
       << ",\"operator\":" << quoted(report.operator_name)
       << ",\"image_tag\":" << quoted(report.image_tag)
       << ",\"previous_active\":" << quoted(report.previous_active)
       << ",\"candidate\":" << quoted(report.candidate)
       << ",\"active_after\":" << (report.active_after.empty() ? "null" : quoted(report.active_after))
       << ",\"requested_at\":" << quoted(format_timestamp(report.requested_at))
       << ",\"finished_at\":" << quoted(format_timestamp(report.finished_at))
       << ",\"duration_ms\":" << report.duration.count()
       << ",\"final_state\":" << quoted(to_string(report.final_state))
       << ",\"failed_stage\":" << (report.failed_stage ? quoted(to_string(*report.failed_stage)) : "null")
       << ",\"error\":{\"code\":" << static_cast<int>(report.error)
       << ",\"class\":" << quoted(to_string(report.error_class))
       << ",\"name\":" << quoted(report.error_name)
       << ",\"detail\":" << quoted(report.error_detail) << "}"
       << ",\"cancelled\":" << (report.cancelled ? "true" : "false")
       << ",\"rollback_attempted\":" << (report.rollback_attempted ? "true" : "false")
       << ",\"rollback_succeeded\":" << (report.rollback_succeeded ? "true" : "false");

    js << ",\"rollback\":";
    if (report.rollback) {
        const auto& rb = *report.rollback;
        js << "{\"triggering_stage\":" << quoted(to_string(rb.triggering_stage))
           << ",\"reason\":" << quoted(rb.reason)
           << ",\"started_at\":" << quoted(format_timestamp(rb.started_at))
           << ",\"completed_at\":" << quoted(format_timestamp(rb.completed_at))
           << ",\"succeeded\":" << (rb.succeeded ? "true" : "false") << "}";
    } else {
        js << "null";
    }

    js << ",\"stages\":[";
    for (size_t i = 0; i < report.stages.size(); ++i) {
        const auto& stage = report.stages[i];
        if (i > 0) js << ",";
        js << "{\"stage\":" << quoted(to_string(stage.stage))
           << ",\"passed\":" << (stage.passed ? "true" : "false")
           << ",\"started_at\":" << quoted(format_timestamp(stage.started_at))
           << ",\"duration_ms\":" << stage.duration.count()
           << ",\"detail\":" << quoted(stage.detail) << "}";
    }
    js << "]";

    js << ",\"health_probes\":";
    probes_json(js, report.health_probes);
    js << ",\"switch_probes\":";
    probes_json(js, report.switch_probes);

    js << ",\"smoke\":";
    if (report.smoke) {
        js << "{\"passed\":" << (report.smoke->passed ? "true" : "false")
           << ",\"timed_out\":" << (report.smoke->timed_out ? "true" : "false")
           << ",\"failed_check\":" << quoted(report.smoke->failed_check)
           << ",\"duration_ms\":" << report.smoke->duration.count()
           << ",\"output\":" << quoted(report.smoke->output) << "}";
    } else {
        js << "null";
    }

    js << ",\"rollback_instructions\":" << quoted(report.rollback_instructions)
       << ",\"log_file\":" << quoted(report.log_file) << "}";

    return js.str();
}

FileReportSink::FileReportSink(std::string dir, std::string signing_key)
    : dir_(std::move(dir)), signing_key_(std::move(signing_key)) {}

std::string FileReportSink::markdown_path(const std::string& deployment_id) const {
    return dir_ + "/bgd_deployment_report_" + deployment_id + ".md";
}

std::string FileReportSink::json_path(const std::string& deployment_id) const {
    return dir_ + "/bgd_deployment_report_" + deployment_id + ".json";
}

Result<void> FileReportSink::write(const DeploymentReport& report) {
    std::string markdown = Reporter::render_markdown(report);
    std::string body = Reporter::render_json(report);

    auto markdown_digest = SecurityUtils::sha256_hex(markdown);
    auto body_digest = SecurityUtils::sha256_hex(body);
    if (markdown_digest.has_error() || body_digest.has_error()) {
        return Result<void>(ErrorCode::REPORT_WRITE_FAILED, "report digest failed");
    }

    std::string integrity = "{\"algorithm\":\"sha256\""
                            ",\"markdown_sha256\":" + quoted(markdown_digest.value()) +
                            ",\"report_sha256\":" + quoted(body_digest.value());
    if (!signing_key_.empty()) {
        auto signature = SecurityUtils::hmac_sha256_hex(signing_key_, body);
        if (signature.has_error()) {
            return Result<void>(ErrorCode::REPORT_WRITE_FAILED, signature.describe());
        }
        integrity += ",\"hmac_sha256\":" + quoted(signature.value());
    }
    integrity += "}";

    auto md_written = write_file(markdown_path(report.deployment_id), markdown);
    if (md_written.has_error()) return md_written;

    auto json_written = write_file(json_path(report.deployment_id),
                                   "{\"report\":" + body + ",\"integrity\":" + integrity + "}\n");
    if (json_written.has_error()) return json_written;

    LOG_INFO("Deployment report written to " + markdown_path(report.deployment_id));
    return Result<void>();
}

} // namespace bgd
