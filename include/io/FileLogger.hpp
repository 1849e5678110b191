#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered append-only text sink for the daemon log file.
 *
 *  © 2025 deskctl contributors — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace deskctl {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file for append, buffers writes, and flushes on demand.
 *
 *  * Buffer is pushed to disk in 4 kB chunks or on `flush()`.
 *  * Only the logger worker thread writes, so no locking here.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one line (caller includes trailing '\n'). */
      void write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kChunk = 4096;

      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace deskctl
