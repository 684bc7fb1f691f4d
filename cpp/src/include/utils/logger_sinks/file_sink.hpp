#pragma once

#include "sink.hpp"
#include <filesystem>
#include <string>

namespace filebridge::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a single file.
 *
 * The file is opened in append mode and created if missing. With `use_flock`, each
 * write holds an advisory `flock` so several processes can share one log file
 * without interleaving lines (POSIX only).
 */
class FileSink : public Sink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened.
    FileSink(const std::string &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    /// @throws std::system_error on a short or failed write.
    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override;

    const std::filesystem::path &path() const { return m_path; }

  private:
    void close() noexcept;

    std::filesystem::path m_path;
    bool m_use_flock{false};
    int m_fd{-1};
};

} // namespace filebridge::utils
