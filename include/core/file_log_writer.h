#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

// Appends log lines to a file and rotates it into numbered backups
// (scanner.log.1, scanner.log.2, ...) once it grows past maxFileSize.
class FileLogWriter : public ILogWriter {
private:
  std::ofstream file_;
  std::string fileName_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  mutable std::mutex mutex_;

public:
  explicit FileLogWriter(const std::string &fileName,
                         size_t maxFileSize = 10 * 1024 * 1024,
                         int maxBackupFiles = 5);
  ~FileLogWriter() override { close(); }

  FileLogWriter(const FileLogWriter &) = delete;
  FileLogWriter &operator=(const FileLogWriter &) = delete;

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;

private:
  void rotateUnlocked();
  void checkAndRotateUnlocked();
};

#endif
