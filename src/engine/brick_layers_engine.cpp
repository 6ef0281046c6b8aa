// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "brick_layers_engine.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <sstream>

using json = nlohmann::json;

namespace bricklayers {

const char* engine_mode_name(EngineMode mode) {
    switch (mode) {
    case EngineMode::IDLE:
        return "idle";
    case EngineMode::LIVE:
        return "live";
    case EngineMode::PRESCAN_PENDING:
        return "prescan-pending";
    case EngineMode::PRESCAN:
        return "prescan";
    }
    return "unknown";
}

// ============================================================================
// EngineStatus
// ============================================================================

json EngineStatus::to_json() const {
    json j = {{"enabled", enabled},
              {"mode", engine_mode_name(mode)},
              {"job_id", job_id},
              {"current_layer", current_layer},
              {"current_phase", current_phase},
              {"moves_transformed", transformed_command_count},
              {"moves_total", motion_command_count},
              {"transform_points", transform_points},
              {"prescan", prescan_status_name(prescan)},
              {"missing_markers", missing_markers},
              {"absolute_extrusion", absolute_extrusion},
              {"faulted", faulted},
              {"z_offset", config.z_offset_magnitude},
              {"extrusion_multiplier", config.extrusion_multiplier},
              {"start_layer", config.start_layer}};
    if (faulted) {
        j["fault_reason"] = fault_reason;
    }
    if (prescan_error.has_error()) {
        j["prescan_error"] = prescan_error.message;
    }
    return j;
}

std::string EngineStatus::format_report() const {
    std::ostringstream out;
    out << "BrickLayers Status:\n";
    out << "  Enabled: " << (enabled ? "True" : "False") << "\n";
    out << "  Mode: " << engine_mode_name(mode) << "\n";
    out << "  Current Layer: " << current_layer << "\n";
    out << "  Brick Phase: " << (current_phase > 0 ? "+" : current_phase < 0 ? "-" : "none")
        << "\n";
    out << "  Z Offset: " << gcode::GCodeCommand::format_number(config.z_offset_magnitude)
        << "mm\n";
    out << "  Extrusion Multiplier: "
        << gcode::GCodeCommand::format_number(config.extrusion_multiplier) << "\n";
    out << "  Start Layer: " << config.start_layer << "\n";
    out << "  Moves Transformed: " << transformed_command_count << "/" << motion_command_count;
    if (mode == EngineMode::PRESCAN) {
        out << "\n  Transform Points: " << transform_points;
    }
    if (prescan_error.has_error()) {
        out << "\n  Warning: " << prescan_error.message << " (live classification)";
    }
    if (missing_markers) {
        out << "\n  Warning: " << BrickError::missing_marker().message;
    }
    if (absolute_extrusion) {
        out << "\n  Warning: " << BrickError::absolute_extrusion().message;
    }
    if (faulted) {
        out << "\n  Fault: " << fault_reason;
    }
    return out.str();
}

// ============================================================================
// Construction
// ============================================================================

BrickLayersEngine::BrickLayersEngine(Configuration config, MarkerSyntax syntax)
    : interceptor_(syntax), prescanner_(syntax),
      config_(std::make_shared<const Configuration>(std::move(config))) {
    spdlog::info("[BrickLayersEngine] Ready. Config: z_offset={}, multiplier={}, start_layer={}",
                 config_->z_offset_magnitude, config_->extrusion_multiplier,
                 config_->start_layer);
}

BrickLayersEngine::~BrickLayersEngine() {
    stop_prescan_thread();
}

std::shared_ptr<const Configuration> BrickLayersEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void BrickLayersEngine::publish(std::shared_ptr<const Configuration> config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = std::move(config);
}

std::shared_ptr<const Configuration> BrickLayersEngine::configuration() const {
    return snapshot();
}

// ============================================================================
// Control surface
// ============================================================================

void BrickLayersEngine::enable() {
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        auto updated = std::make_shared<Configuration>(*config_);
        updated->enabled = true;
        config_ = std::move(updated);
    }

    std::lock_guard<std::mutex> lock(job_mutex_);
    if (job_ && job_->uses_table()) {
        spdlog::info("[BrickLayersEngine] ENABLED ({} transform points ready)",
                     job_->table->size());
    } else if (job_ && job_->prescan_status == PreScanStatus::PENDING) {
        spdlog::info("[BrickLayersEngine] ENABLED (pre-scan of {} in progress)",
                     job_->source_name);
    } else {
        spdlog::info("[BrickLayersEngine] ENABLED (live classification)");
    }
}

void BrickLayersEngine::disable() {
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (!config_->enabled) {
            return;
        }
        auto updated = std::make_shared<Configuration>(*config_);
        updated->enabled = false;
        config_ = std::move(updated);
    }
    spdlog::info("[BrickLayersEngine] DISABLED");
}

bool BrickLayersEngine::is_enabled() const {
    return snapshot()->enabled;
}

BrickError BrickLayersEngine::set_parameter(const std::string& name, const json& value) {
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        Configuration updated = *config_;
        BrickError err = apply_parameter(updated, name, value);
        if (err.has_error()) {
            spdlog::warn("[BrickLayersEngine] Rejected {}: {}", name, err.message);
            return err;
        }
        config_ = std::make_shared<const Configuration>(std::move(updated));
    }
    spdlog::info("[BrickLayersEngine] {} = {}", name, value.dump());

    bool runtime_only = (name == "enabled" || name == "verbose" || name == "prescan");
    if (!runtime_only) {
        std::lock_guard<std::mutex> lock(job_mutex_);
        if (job_ && (job_->uses_table() || job_->prescan_status == PreScanStatus::PENDING)) {
            spdlog::info("[BrickLayersEngine] Job {} keeps its pre-scanned decisions; {} applies "
                         "from the next job",
                         job_->job_id, name);
        }
    }
    return {};
}

BrickError BrickLayersEngine::set_parameter_string(const std::string& name,
                                                   const std::string& text) {
    return set_parameter(name, json(text));
}

EngineStatus BrickLayersEngine::status() const {
    auto config = snapshot();

    EngineStatus st;
    st.enabled = config->enabled;
    st.config = *config;

    std::lock_guard<std::mutex> lock(job_mutex_);
    if (!job_) {
        return st;
    }

    const JobContext& job = *job_;
    st.job_id = job.job_id;
    st.current_layer = job.current_layer;
    st.current_phase = job.last_phase;
    st.transformed_command_count = job.transformed_commands;
    st.motion_command_count = job.motion_commands;
    st.faulted = job.faulted;
    st.fault_reason = job.fault_reason;
    st.prescan_error = job.prescan_error;
    st.prescan = job.prescan_status;

    if (job.prescan_status == PreScanStatus::PENDING) {
        st.mode = EngineMode::PRESCAN_PENDING;
    } else if (job.uses_table()) {
        st.mode = EngineMode::PRESCAN;
        st.transform_points = job.table->size();
    } else {
        st.mode = EngineMode::LIVE;
    }

    if (config->require_feature_markers) {
        if (job.uses_table()) {
            st.missing_markers = job.table->feature_markers_seen() == 0;
        } else {
            st.missing_markers = job.motion_commands > 0 && job.feature_markers_seen == 0;
        }
    }
    st.absolute_extrusion = job.uses_table() ? job.table->absolute_extrusion_skips() > 0
                                             : job.planner.absolute_extrusion_skips() > 0;
    return st;
}

// ============================================================================
// Job lifecycle
// ============================================================================

JobContext& BrickLayersEngine::create_job_locked(const std::string& source_name,
                                                 PreScanStatus prescan_status) {
    if (job_) {
        spdlog::info("[BrickLayersEngine] Replacing job {}", job_->job_id);
    }
    job_ = std::make_unique<JobContext>();
    job_->job_id = next_job_id_++;
    job_->source_name = source_name;
    job_->prescan_status = prescan_status;
    return *job_;
}

uint64_t BrickLayersEngine::start_job(std::unique_ptr<gcode::GCodeStreamSource> source) {
    auto config = snapshot();

    // An older scan must be gone before its job is replaced
    stop_prescan_thread();

    bool prescan = source && config->prescan;
    std::string source_name = source ? source->describe() : "<live>";
    uint64_t job_id = 0;
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        JobContext& job =
            create_job_locked(source_name, prescan ? PreScanStatus::PENDING : PreScanStatus::NONE);
        job_id = job.job_id;
        prescan_cancel_ = false;
    }
    prescan_cv_.notify_all();

    if (prescan) {
        spdlog::info("[BrickLayersEngine] Job {} started, pre-scanning {}", job_id, source_name);
        prescan_thread_ = std::thread(&BrickLayersEngine::run_prescan, this, job_id,
                                      std::move(source), *config);
    } else {
        spdlog::info("[BrickLayersEngine] Job {} started with live classification{}", job_id,
                     source ? " (pre-scan disabled)" : "");
    }
    return job_id;
}

void BrickLayersEngine::run_prescan(uint64_t job_id,
                                    std::unique_ptr<gcode::GCodeStreamSource> source,
                                    Configuration config) {
    PreScanResult result;
    try {
        result = prescanner_.scan(*source, config, &prescan_cancel_);
    } catch (const std::exception& e) {
        result.table.reset();
        result.error = BrickError::prescan_io(source->describe(), e.what());
        spdlog::warn("[BrickLayersEngine] Pre-scan threw: {}", e.what());
    }

    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        if (!job_ || job_->job_id != job_id || job_->prescan_status != PreScanStatus::PENDING) {
            spdlog::debug("[BrickLayersEngine] Discarding pre-scan result of job {}", job_id);
            return;
        }

        if (result.table) {
            job_->table = std::move(result.table);
            job_->prescan_status = PreScanStatus::READY;
            spdlog::info("[BrickLayersEngine] Job {}: {} transform points ready", job_id,
                         job_->table->size());
        } else if (result.cancelled) {
            job_->prescan_status = PreScanStatus::ABANDONED;
        } else {
            job_->prescan_status = PreScanStatus::FAILED;
            job_->prescan_error = result.error;
            spdlog::warn("[BrickLayersEngine] Job {}: {}; falling back to live classification",
                         job_id, result.error.message);
        }
    }
    prescan_cv_.notify_all();
}

void BrickLayersEngine::stop_prescan_thread() {
    prescan_cancel_ = true;
    if (prescan_thread_.joinable()) {
        prescan_thread_.join();
    }
}

bool BrickLayersEngine::wait_for_prescan() {
    std::unique_lock<std::mutex> lock(job_mutex_);
    prescan_cv_.wait(lock, [this] {
        return !job_ || job_->prescan_status != PreScanStatus::PENDING;
    });
    return job_ && job_->uses_table();
}

void BrickLayersEngine::abandon_prescan() {
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        if (!job_ || job_->prescan_status != PreScanStatus::PENDING) {
            return;
        }
        job_->prescan_status = PreScanStatus::ABANDONED;
        prescan_cancel_ = true;
        spdlog::warn("[BrickLayersEngine] Job {}: pre-scan abandoned, using live classification",
                     job_->job_id);
    }
    prescan_cv_.notify_all();
}

void BrickLayersEngine::discard_job(const char* verb) {
    stop_prescan_thread();

    auto config = snapshot();
    {
        std::lock_guard<std::mutex> lock(job_mutex_);
        if (job_) {
            spdlog::info("[BrickLayersEngine] Job {} {}: {}/{} moves transformed", job_->job_id,
                         verb, job_->transformed_commands, job_->motion_commands);
            bool no_markers = job_->uses_table() ? job_->table->feature_markers_seen() == 0
                                                 : job_->feature_markers_seen == 0;
            if (config->require_feature_markers && no_markers && job_->motion_commands > 0) {
                spdlog::warn("[BrickLayersEngine] Job {}: {}", job_->job_id,
                             BrickError::missing_marker().message);
            }
            job_.reset();
        }
    }
    prescan_cv_.notify_all();
    disable();
}

void BrickLayersEngine::end_job() {
    discard_job("finished");
}

void BrickLayersEngine::abort_job() {
    discard_job("aborted");
}

bool BrickLayersEngine::has_job() const {
    std::lock_guard<std::mutex> lock(job_mutex_);
    return job_ != nullptr;
}

// ============================================================================
// Real-time path
// ============================================================================

StreamCommand BrickLayersEngine::intercept(const StreamCommand& command) {
    std::unique_lock<std::mutex> lock(job_mutex_);
    if (!job_) {
        spdlog::debug("[BrickLayersEngine] No active job, starting one with live classification");
        create_job_locked("<live>", PreScanStatus::NONE);
    }

    if (job_->prescan_status == PreScanStatus::PENDING) {
        spdlog::debug("[BrickLayersEngine] Waiting for pre-scan of job {}", job_->job_id);
        prescan_cv_.wait(lock, [this] {
            return !job_ || job_->prescan_status != PreScanStatus::PENDING;
        });
        if (!job_) {
            return command;
        }
    }

    // One snapshot per command: a concurrent update is seen whole or not at all
    auto config = snapshot();
    return interceptor_.intercept(*job_, *config, command);
}

std::shared_ptr<TransformStage> BrickLayersEngine::make_stage() {
    return std::make_shared<BrickLayersStage>(*this);
}

} // namespace bricklayers
