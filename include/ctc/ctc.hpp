#pragma once

/// @file ctc.hpp
/// @brief Umbrella header for the combat timing core.

#include "ctc/core/result.hpp"
#include "ctc/version.hpp"

#include "ctc/combat/action_coordinator.hpp"
#include "ctc/combat/attack_routine.hpp"
#include "ctc/combat/combat_pulse.hpp"
#include "ctc/combat/legacy_timing_provider.hpp"
#include "ctc/combat/weapon_timing_provider.hpp"

#include "ctc/audit/combat_audit.hpp"
#include "ctc/audit/shadow_verifier.hpp"

#include "ctc/service/combat_timing_config.hpp"
#include "ctc/service/combat_timing_service.hpp"
