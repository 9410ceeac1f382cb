// Repository: BellWatch
// Component: Session JSON Encoding
// Purpose: JSON text for exported sessions and their events.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_EXPORTER_SESSION_JSON_HPP_
#define BELLWATCH_EXPORTER_SESSION_JSON_HPP_

#include <string>

#include "bellwatch/runtime/BellTypes.hpp"
#include "bellwatch/runtime/SessionViews.hpp"

namespace bellwatch::exporter {

std::string JsonEscape(const std::string& s);

// Single-line objects.
std::string BellEventToJson(const runtime::BellEvent& bell);
std::string TimelineEventToJson(const runtime::TimelineEvent& event);

// Two-space indented document:
// { sessionId, startTime, exportTime, duration, statistics{...},
//   bellHistory[...], timeline[...], metadata{version, format} }
std::string SessionExportToJson(const runtime::SessionExport& snapshot);

}  // namespace bellwatch::exporter

#endif  // BELLWATCH_EXPORTER_SESSION_JSON_HPP_
