// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "gcode_command.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace bricklayers {

/**
 * @brief One named step between the command source and the motion executor
 *
 * transform() is called once per command, in stream order, from the single
 * command-issue thread. A stage that has nothing to do returns its input
 * unchanged. Implementations must not throw.
 */
class TransformStage {
  public:
    virtual ~TransformStage() = default;

    /// Unique name within a chain ("brick_layers", "bed_mesh", ...)
    virtual std::string name() const = 0;

    virtual StreamCommand transform(const StreamCommand& command) = 0;
};

/**
 * @brief Stage wrapping a callable; handy for host-side adjustments and tests
 */
class FunctionStage : public TransformStage {
  public:
    using Fn = std::function<StreamCommand(const StreamCommand&)>;

    FunctionStage(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    std::string name() const override {
        return name_;
    }

    StreamCommand transform(const StreamCommand& command) override {
        return fn_ ? fn_(command) : command;
    }

  private:
    std::string name_;
    Fn fn_;
};

/**
 * @brief Ordered list of transform stages
 *
 * Each command runs through the stages front to back; the output of one stage
 * is the input of the next. Stage order is explicit and queryable so placement
 * relative to other compensations (e.g. mesh leveling) can be asserted.
 *
 * Not thread-safe: build the chain before streaming starts.
 */
class TransformChain {
  public:
    /// Append a stage; false if the name is already taken
    bool add_stage(std::shared_ptr<TransformStage> stage);

    /// Insert before the stage named @p anchor; false if anchor missing or name taken
    bool insert_before(const std::string& anchor, std::shared_ptr<TransformStage> stage);

    /// Insert after the stage named @p anchor; false if anchor missing or name taken
    bool insert_after(const std::string& anchor, std::shared_ptr<TransformStage> stage);

    /// Remove by name; false if not found
    bool remove_stage(const std::string& name);

    std::shared_ptr<TransformStage> find(const std::string& name) const;

    std::vector<std::string> stage_names() const;

    size_t size() const {
        return stages_.size();
    }

    /// Run one command through every stage
    StreamCommand run(const StreamCommand& command) const;

  private:
    bool insert_at(size_t index, std::shared_ptr<TransformStage> stage);
    std::ptrdiff_t index_of(const std::string& name) const;

    std::vector<std::shared_ptr<TransformStage>> stages_;
};

} // namespace bricklayers
