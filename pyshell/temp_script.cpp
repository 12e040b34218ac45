#include "temp_script.hpp"

#include "safecall.hpp"

#include <boost/filesystem/operations.hpp>

#include <cerrno>
#include <string>
#include <system_error>

#include <stdlib.h>
#include <unistd.h>

namespace pyshell {

namespace {

/**
 * @brief Write an entire buffer to a file descriptor
 *
 * @return 0 on success or the errno value of the failed write
 */
auto write_all(int const fd, std::string_view data) -> int
{
    while (not data.empty())
    {
        auto const n = ::write(fd, data.data(), data.size());
        if (n < 0)
        {
            if (errno == EINTR) continue;
            return errno;
        }
        data.remove_prefix(n);
    }
    return 0;
}

} // namespace

auto TempScript::create(
    std::string_view const contents,
    std::string_view const prefix,
    std::string_view const suffix
) -> TempScript
{
    auto pattern = (boost::filesystem::temp_directory_path() / (std::string{prefix} + "XXXXXX" + std::string{suffix})).string();

    auto const fd = mkstemps(pattern.data(), static_cast<int>(suffix.size()));
    if (-1 == fd)
    {
        throw std::system_error{errno, std::generic_category(), "failed to create temporary script"};
    }

    // From here on the destructor removes the file on every error path
    auto script = TempScript{pattern};

    auto const write_error = write_all(fd, contents);
    auto const close_error = ::close(fd) == -1 ? errno : 0;
    if (write_error != 0)
    {
        throw std::system_error{write_error, std::generic_category(), "failed to write temporary script"};
    }
    if (close_error != 0)
    {
        throw std::system_error{close_error, std::generic_category(), "failed to write temporary script"};
    }

    return script;
}

auto TempScript::operator=(TempScript&& other) noexcept -> TempScript&
{
    if (this != &other)
    {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TempScript::~TempScript()
{
    remove();
}

auto TempScript::remove() noexcept -> void
{
    if (not path_.empty())
    {
        boost::system::error_code err;
        boost::filesystem::remove(path_, err);
        if (err)
        {
            report_error("temporary script cleanup", err.message().c_str());
        }
        path_.clear();
    }
}

} // namespace pyshell
