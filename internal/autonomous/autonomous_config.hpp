#pragma once

#include "muse/autonomous/v1.hpp"

namespace muse::autonomous {

/*
  Built-in configuration:
    disabled, 30 minute interval, quality threshold 65,
    1 concurrent / 48 daily operations,
    09:00-18:00 enabled, 22:00-06:00 disabled,
    70% cpu, 2048 MB, 100 calls/hour, 4000 tokens per operation,
    every content type.
*/
muse::autonomous::v1::AutonomousConfig DefaultAutonomousConfig();

// Non-zero scalars and non-empty lists of overlay replace the base values.
muse::autonomous::v1::AutonomousConfig Overlay(muse::autonomous::v1::AutonomousConfig        base,
                                               const muse::autonomous::v1::AutonomousConfig& overlay);

// Fields present in the patch replace the base values.
muse::autonomous::v1::AutonomousConfig ApplyPatch(muse::autonomous::v1::AutonomousConfig             base,
                                                  const muse::autonomous::v1::AutonomousConfigPatch& patch);

// Throws ValidationError.
void ValidateConfig(const muse::autonomous::v1::AutonomousConfig& config);

} // namespace muse::autonomous
