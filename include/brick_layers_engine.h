// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brick_config.h"
#include "brick_error.h"
#include "gcode_stream_source.h"
#include "job_context.h"
#include "move_interceptor.h"
#include "stream_prescanner.h"
#include "transform_stage.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace bricklayers {

/**
 * @brief Where decisions currently come from
 */
enum class EngineMode {
    IDLE,            ///< No active job
    LIVE,            ///< Inline classification
    PRESCAN_PENDING, ///< Waiting for the pre-scan to finish
    PRESCAN,         ///< Decisions read from the pre-scan table
};

const char* engine_mode_name(EngineMode mode);

/**
 * @brief Snapshot returned by BrickLayersEngine::status()
 */
struct EngineStatus {
    bool enabled = false;
    EngineMode mode = EngineMode::IDLE;
    uint64_t job_id = 0;
    size_t current_layer = 0;
    int current_phase = 0; ///< +1 / -1 of the last applied offset, 0 before any
    size_t transformed_command_count = 0;
    size_t motion_command_count = 0;
    size_t transform_points = 0; ///< Eligible positions in the pre-scan table
    PreScanStatus prescan = PreScanStatus::NONE;
    bool missing_markers = false;
    bool absolute_extrusion = false; ///< Eligible moves were skipped under M82
    bool faulted = false;
    std::string fault_reason;
    BrickError prescan_error; ///< Last pre-scan failure of the active job
    Configuration config;

    /// Host status object (enabled, current_layer, moves_transformed, ...)
    nlohmann::json to_json() const;

    /// Multi-line operator response
    std::string format_report() const;
};

/**
 * @brief The brick layers transformation engine
 *
 * Owns the configuration, the active job and the pre-scan worker, and exposes
 * the control surface (enable/disable/set_parameter/status) and the real-time
 * entry point intercept().
 *
 * Threading:
 * - intercept() is called from one command-issue thread, in stream order.
 * - Control operations may be called from any thread at any time. The
 *   configuration is published as an immutable snapshot; intercept() takes one
 *   snapshot per command so it never sees a half-applied update.
 * - start_job() with a source launches the pre-scan on a worker thread;
 *   intercept() blocks until the scan finishes, fails or is abandoned.
 *
 * @code
 * BrickLayersEngine engine(config.brick_layers(), config.markers());
 * TransformChain chain;
 * chain.add_stage(engine.make_stage());
 * engine.start_job(std::make_unique<gcode::FileStreamSource>(path));
 * for (each line, position) out << chain.run({position, line}).text;
 * engine.end_job();
 * @endcode
 */
class BrickLayersEngine {
  public:
    explicit BrickLayersEngine(Configuration config = {}, MarkerSyntax syntax = {});
    ~BrickLayersEngine();

    BrickLayersEngine(const BrickLayersEngine&) = delete;
    BrickLayersEngine& operator=(const BrickLayersEngine&) = delete;

    // ========================================================================
    // Control surface
    // ========================================================================

    void enable();

    /// Effective for every intercept() that starts after this returns
    void disable();

    bool is_enabled() const;

    /**
     * @brief Validate and apply one parameter
     *
     * On error the previous configuration stays in effect.
     */
    BrickError set_parameter(const std::string& name, const nlohmann::json& value);

    /// Same as set_parameter() for operator text ("0.15", "true", "inner-wall,infill")
    BrickError set_parameter_string(const std::string& name, const std::string& text);

    /// Current configuration snapshot
    std::shared_ptr<const Configuration> configuration() const;

    EngineStatus status() const;

    // ========================================================================
    // Job lifecycle
    // ========================================================================

    /**
     * @brief Begin a new job, discarding any previous one
     *
     * @param source Full stream for pre-scanning; nullptr (or prescan disabled
     *               in the configuration) means live classification
     * @return Id of the new job
     */
    uint64_t start_job(std::unique_ptr<gcode::GCodeStreamSource> source = nullptr);

    /// Normal completion: job state dropped, engine disabled
    void end_job();

    /// Cancellation: pre-scan stopped, table and state dropped, engine disabled
    void abort_job();

    bool has_job() const;

    /**
     * @brief Block until the pre-scan of the active job is no longer pending
     * @return true if a table is ready
     */
    bool wait_for_prescan();

    /// Stop waiting for the pre-scan and classify live instead
    void abandon_prescan();

    // ========================================================================
    // Real-time path
    // ========================================================================

    /**
     * @brief Transform one command
     *
     * Without an active job a live job is started implicitly. Never throws.
     */
    StreamCommand intercept(const StreamCommand& command);

    /// This engine as the "brick_layers" stage of a TransformChain
    std::shared_ptr<TransformStage> make_stage();

    const MarkerSyntax& marker_syntax() const {
        return interceptor_.classifier().syntax();
    }

  private:
    std::shared_ptr<const Configuration> snapshot() const;
    void publish(std::shared_ptr<const Configuration> config);
    JobContext& create_job_locked(const std::string& source_name, PreScanStatus prescan_status);
    void stop_prescan_thread();
    void discard_job(const char* verb);
    void run_prescan(uint64_t job_id, std::unique_ptr<gcode::GCodeStreamSource> source,
                     Configuration config);

    MoveInterceptor interceptor_;
    StreamPreScanner prescanner_;

    mutable std::mutex config_mutex_;
    std::shared_ptr<const Configuration> config_;

    mutable std::mutex job_mutex_;
    std::condition_variable prescan_cv_;
    std::unique_ptr<JobContext> job_;
    uint64_t next_job_id_ = 1;

    std::atomic<bool> prescan_cancel_{false};
    std::thread prescan_thread_;
};

/**
 * @brief Adapter exposing an engine as a TransformStage
 */
class BrickLayersStage : public TransformStage {
  public:
    static constexpr const char* NAME = "brick_layers";

    explicit BrickLayersStage(BrickLayersEngine& engine) : engine_(engine) {}

    std::string name() const override {
        return NAME;
    }

    StreamCommand transform(const StreamCommand& command) override {
        return engine_.intercept(command);
    }

  private:
    BrickLayersEngine& engine_;
};

} // namespace bricklayers
