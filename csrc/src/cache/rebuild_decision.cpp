// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "cache/rebuild_decision.h"

#include "cache/signature.h"
#include "utilities/utils.h"

namespace forgecache::cache {

RebuildDecision needs_rebuild(const ConfigurationSnapshot& current, const std::optional<PersistedBuildRecord>& record) {
    RebuildDecision decision;
    if (!record) {
        decision.Rebuild = true;
        decision.FirstRun = true;
        return decision;
    }

    for (auto name : tracked_parameter_names()) {
        if (current.value(name) != record->value(name)) {
            decision.ChangedKeys.emplace_back(name);
        }
    }

    decision.SignatureMismatch = !sign(current).matches(record->Signature);
    decision.Rebuild = !decision.ChangedKeys.empty() || decision.SignatureMismatch;
    return decision;
}

RebuildDecision needs_rebuild(const ConfigurationSnapshot& current, const std::filesystem::path& record_path) {
    return needs_rebuild(current, load_record(record_path));
}

ModeSwitch detect_mode_switch(const ConfigurationSnapshot& current, const std::optional<PersistedBuildRecord>& record) {
    ModeSwitch result;
    result.Current = to_lower(current.value(param::InferenceEngine));
    if (!record) {
        return result;
    }
    result.Previous = to_lower(record->value(param::InferenceEngine));
    result.ForcedFullWipe = !result.Previous.empty() && result.Previous != result.Current;
    return result;
}

ModeSwitch detect_mode_switch(const ConfigurationSnapshot& current, const std::filesystem::path& record_path) {
    return detect_mode_switch(current, load_record(record_path));
}

}  // namespace forgecache::cache
