#pragma once

#include "core/tool_type.h"
#include "usage/delta_engine.h"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace codenv {

// Cumulative session totals from the JSON a tool hands its statusline
// command. nullopt when the payload reports no usage at all.
std::optional<UsageObservation> parse_statusline_totals(ToolType tool, const nlohmann::json& input);

std::string statusline_session_id(const nlohmann::json& input);

// `model` as a string, or model.id / model.display_name.
std::string statusline_model(const nlohmann::json& input);

}
