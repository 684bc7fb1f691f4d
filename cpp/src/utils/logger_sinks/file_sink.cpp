#include "fbr_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#if defined(FILEBRIDGE_IS_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace filebridge::utils
{

FileSink::FileSink(const std::string &path, bool use_flock) : m_path(path), m_use_flock(use_flock)
{
#if defined(FILEBRIDGE_IS_POSIX)
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        const std::error_code ec(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, ec.message()));
    }
#else
    throw std::runtime_error("FileSink is only supported on POSIX platforms.");
#endif
}

FileSink::~FileSink()
{
    close();
}

void FileSink::close() noexcept
{
#if defined(FILEBRIDGE_IS_POSIX)
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
#endif
}

void FileSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    if (m_fd == -1)
    {
        return;
    }
    const std::string content = format_logmsg(msg, mode);
#if defined(FILEBRIDGE_IS_POSIX)
    if (m_use_flock)
    {
        // Advisory only; keeps lines from concurrent writer processes intact.
        ::flock(m_fd, LOCK_EX);
    }
    const ssize_t bytes_written = ::write(m_fd, content.data(), content.size());
    const int saved_errno = errno;
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }
    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != content.size())
    {
        throw std::system_error(saved_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
#endif
}

void FileSink::flush()
{
#if defined(FILEBRIDGE_IS_POSIX)
    if (m_fd != -1)
    {
        ::fsync(m_fd);
    }
#endif
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace filebridge::utils
