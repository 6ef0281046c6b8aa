// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brick_config.h"
#include "command_classifier.h"
#include "gcode_command.h"
#include "job_context.h"

namespace bricklayers {

/**
 * @brief Applies transform decisions to the outgoing command stream
 *
 * For each command either returns it untouched (the overwhelmingly common
 * case) or returns a copy whose Z word is shifted by the decision's z_delta and
 * whose E word is scaled by e_multiplier. Nothing else in the line changes.
 *
 * Decisions come from the job's pre-scan table when one is ready, otherwise
 * from the classifier and planner inline. Only motion commands are ever
 * rewritten.
 *
 * A StreamPosition that does not strictly increase faults the job: every later
 * command of that job passes through unmodified.
 */
class MoveInterceptor {
  public:
    explicit MoveInterceptor(MarkerSyntax syntax = {});

    /**
     * @brief Process one command
     *
     * @param job Per-job context (mutated: state, counters, fault flag)
     * @param config Configuration snapshot for this command
     * @param command Command as issued by the host
     * @return Command to forward downstream
     */
    StreamCommand intercept(JobContext& job, const Configuration& config,
                            const StreamCommand& command) const;

    /**
     * @brief Rewrite a motion line according to an eligible decision
     *
     * @return Rewritten text, or nullopt if the line has neither Z nor E
     */
    static std::optional<std::string> apply(const gcode::GCodeCommand& cmd,
                                            const TransformDecision& decision);

    const CommandClassifier& classifier() const {
        return classifier_;
    }

  private:
    TransformDecision decide_live(JobContext& job, const Configuration& config,
                                  const StreamCommand& command,
                                  std::optional<gcode::GCodeCommand>& parsed) const;
    TransformDecision decide_from_table(JobContext& job, const Configuration& config,
                                        const StreamCommand& command,
                                        std::optional<gcode::GCodeCommand>& parsed) const;

    CommandClassifier classifier_;
};

} // namespace bricklayers
