// Repository: BellWatch
// Component: Session JSON Encoding
// Copyright (c) 2026 BellWatch

#include "bellwatch/exporter/SessionJson.hpp"

#include <iomanip>
#include <sstream>

namespace bellwatch::exporter {

namespace {

void WriteNumber(std::ostringstream& o, double v) {
  o << std::setprecision(10) << v;
}

}  // namespace

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else out += c;
  }
  return out;
}

std::string BellEventToJson(const runtime::BellEvent& bell) {
  std::ostringstream o;
  o << "{\"id\":\"" << JsonEscape(bell.id) << "\""
    << ",\"type\":\"" << runtime::BellTypeName(bell.type) << "\""
    << ",\"timestamp\":" << bell.timestamp_ms
    << ",\"confidence\":";
  WriteNumber(o, bell.confidence);
  o << ",\"frequency\":";
  WriteNumber(o, bell.frequency_hz);
  o << ",\"duration\":";
  WriteNumber(o, bell.duration_ms);
  o << ",\"time\":\"" << JsonEscape(bell.time) << "\"}";
  return o.str();
}

std::string TimelineEventToJson(const runtime::TimelineEvent& event) {
  std::ostringstream o;
  o << "{\"id\":\"" << JsonEscape(event.id) << "\""
    << ",\"type\":\"" << runtime::TimelineTypeName(event.type) << "\""
    << ",\"text\":\"" << JsonEscape(event.text) << "\""
    << ",\"timestamp\":" << event.timestamp_ms
    << ",\"time\":\"" << JsonEscape(event.time) << "\""
    << ",\"confidence\":";
  WriteNumber(o, event.confidence);
  o << "}";
  return o.str();
}

std::string SessionExportToJson(const runtime::SessionExport& snapshot) {
  std::ostringstream o;
  o << "{\n"
    << "  \"sessionId\": \"" << JsonEscape(snapshot.session_id) << "\",\n"
    << "  \"startTime\": " << snapshot.start_time_ms << ",\n"
    << "  \"exportTime\": " << snapshot.export_time_ms << ",\n"
    << "  \"duration\": " << snapshot.duration_ms << ",\n"
    << "  \"statistics\": {\n"
    << "    \"singleBells\": " << snapshot.stats.single_bells << ",\n"
    << "    \"doubleBells\": " << snapshot.stats.double_bells << ",\n"
    << "    \"totalStops\": " << snapshot.stats.total_stops << "\n"
    << "  },\n";

  o << "  \"bellHistory\": [";
  for (std::size_t i = 0; i < snapshot.bell_history.size(); ++i) {
    o << (i == 0 ? "\n    " : ",\n    ") << BellEventToJson(snapshot.bell_history[i]);
  }
  o << (snapshot.bell_history.empty() ? "],\n" : "\n  ],\n");

  o << "  \"timeline\": [";
  for (std::size_t i = 0; i < snapshot.timeline.size(); ++i) {
    o << (i == 0 ? "\n    " : ",\n    ") << TimelineEventToJson(snapshot.timeline[i]);
  }
  o << (snapshot.timeline.empty() ? "],\n" : "\n  ],\n");

  o << "  \"metadata\": {\n"
    << "    \"version\": \"" << runtime::SessionExport::kVersion << "\",\n"
    << "    \"format\": \"" << runtime::SessionExport::kFormat << "\"\n"
    << "  }\n"
    << "}\n";
  return o.str();
}

}  // namespace bellwatch::exporter
