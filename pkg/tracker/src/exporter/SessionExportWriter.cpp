// Repository: BellWatch
// Component: Session Export Writer
// Copyright (c) 2026 BellWatch

#include "bellwatch/exporter/SessionExportWriter.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

#include "bellwatch/exporter/SessionJson.hpp"
#include "bellwatch/util/Logger.hpp"

namespace bellwatch::exporter {

using bellwatch::util::Logger;

namespace {

ExportWriteResult Failed(const std::string& session_id, const std::string& error) {
  std::ostringstream oss;
  oss << "[SessionExportWriter] EXPORT_WRITE_FAILED session=" << session_id
      << " error=" << error;
  Logger::Error(oss.str());
  ExportWriteResult result;
  result.error = error;
  return result;
}

}  // namespace

SessionExportWriter::SessionExportWriter(std::string export_dir)
    : export_dir_(std::move(export_dir)) {}

std::string SessionExportWriter::FileNameFor(const runtime::SessionExport& snapshot) {
  return "session-" + snapshot.session_id + "-" +
         std::to_string(snapshot.export_time_ms) + ".json";
}

ExportWriteResult SessionExportWriter::Write(const runtime::SessionExport& snapshot) {
  std::lock_guard<std::mutex> lock(write_mutex_);

  std::error_code ec;
  std::filesystem::create_directories(export_dir_, ec);
  if (ec) {
    return Failed(snapshot.session_id,
                  "cannot create directory " + export_dir_ + ": " + ec.message());
  }

  const std::string path = export_dir_ + "/" + FileNameFor(snapshot);
  const std::string tmp_path =
      path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  const std::string content = SessionExportToJson(snapshot);

  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc);
    if (!of) {
      return Failed(snapshot.session_id, "cannot open " + tmp_path);
    }
    of << content;
    of.flush();
    if (!of) {
      of.close();
      (void)unlink(tmp_path.c_str());
      return Failed(snapshot.session_id, "short write to " + tmp_path);
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    (void)unlink(tmp_path.c_str());
    return Failed(snapshot.session_id, "cannot rename into " + path);
  }

  std::ostringstream oss;
  oss << "[SessionExportWriter] EXPORT_WRITTEN session=" << snapshot.session_id
      << " path=" << path << " bells=" << snapshot.bell_history.size();
  Logger::Info(oss.str());

  ExportWriteResult result;
  result.written = true;
  result.path = path;
  return result;
}

}  // namespace bellwatch::exporter
