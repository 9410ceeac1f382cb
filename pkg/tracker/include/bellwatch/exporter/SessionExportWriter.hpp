// Repository: BellWatch
// Component: Session Export Writer
// Purpose: Persists export snapshots as JSON files in an export directory.
// Copyright (c) 2026 BellWatch

#ifndef BELLWATCH_EXPORTER_SESSION_EXPORT_WRITER_HPP_
#define BELLWATCH_EXPORTER_SESSION_EXPORT_WRITER_HPP_

#include <mutex>
#include <string>

#include "bellwatch/runtime/SessionViews.hpp"

namespace bellwatch::exporter {

struct ExportWriteResult {
  bool written = false;
  std::string path;
  std::string error;
};

// Files are named session-<id>-<exportTimeMs>.json. Each file is written to a
// temporary name and renamed into place so readers never see a partial file.
class SessionExportWriter {
 public:
  static constexpr const char* kDefaultExportDir = "data/exports";

  explicit SessionExportWriter(std::string export_dir = kDefaultExportDir);

  SessionExportWriter(const SessionExportWriter&) = delete;
  SessionExportWriter& operator=(const SessionExportWriter&) = delete;

  // Creates the directory on demand. Failures are logged and returned.
  ExportWriteResult Write(const runtime::SessionExport& snapshot);

  const std::string& export_dir() const { return export_dir_; }

  static std::string FileNameFor(const runtime::SessionExport& snapshot);

 private:
  std::string export_dir_;
  std::mutex write_mutex_;
};

}  // namespace bellwatch::exporter

#endif  // BELLWATCH_EXPORTER_SESSION_EXPORT_WRITER_HPP_
