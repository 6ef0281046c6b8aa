// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "transform_stage.h"

#include <spdlog/spdlog.h>

namespace bricklayers {

std::ptrdiff_t TransformChain::index_of(const std::string& name) const {
    for (size_t i = 0; i < stages_.size(); ++i) {
        if (stages_[i]->name() == name) {
            return static_cast<std::ptrdiff_t>(i);
        }
    }
    return -1;
}

bool TransformChain::insert_at(size_t index, std::shared_ptr<TransformStage> stage) {
    if (!stage) {
        spdlog::warn("[TransformChain] Refusing to add null stage");
        return false;
    }
    std::string name = stage->name();
    if (index_of(name) >= 0) {
        spdlog::warn("[TransformChain] Stage '{}' already registered", name);
        return false;
    }
    stages_.insert(stages_.begin() + static_cast<std::ptrdiff_t>(index), std::move(stage));
    spdlog::debug("[TransformChain] Added stage '{}' at position {}", name, index);
    return true;
}

bool TransformChain::add_stage(std::shared_ptr<TransformStage> stage) {
    return insert_at(stages_.size(), std::move(stage));
}

bool TransformChain::insert_before(const std::string& anchor,
                                   std::shared_ptr<TransformStage> stage) {
    auto idx = index_of(anchor);
    if (idx < 0) {
        spdlog::warn("[TransformChain] Anchor stage '{}' not found", anchor);
        return false;
    }
    return insert_at(static_cast<size_t>(idx), std::move(stage));
}

bool TransformChain::insert_after(const std::string& anchor,
                                  std::shared_ptr<TransformStage> stage) {
    auto idx = index_of(anchor);
    if (idx < 0) {
        spdlog::warn("[TransformChain] Anchor stage '{}' not found", anchor);
        return false;
    }
    return insert_at(static_cast<size_t>(idx) + 1, std::move(stage));
}

bool TransformChain::remove_stage(const std::string& name) {
    auto idx = index_of(name);
    if (idx < 0) {
        return false;
    }
    stages_.erase(stages_.begin() + idx);
    spdlog::debug("[TransformChain] Removed stage '{}'", name);
    return true;
}

std::shared_ptr<TransformStage> TransformChain::find(const std::string& name) const {
    auto idx = index_of(name);
    return idx < 0 ? nullptr : stages_[static_cast<size_t>(idx)];
}

std::vector<std::string> TransformChain::stage_names() const {
    std::vector<std::string> names;
    names.reserve(stages_.size());
    for (const auto& stage : stages_) {
        names.push_back(stage->name());
    }
    return names;
}

StreamCommand TransformChain::run(const StreamCommand& command) const {
    StreamCommand current = command;
    for (const auto& stage : stages_) {
        current = stage->transform(current);
    }
    return current;
}

} // namespace bricklayers
