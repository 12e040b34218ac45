#pragma once
/**
 * @file temp_script.hpp
 * @brief Scoped temporary script files
 *
 */

#include <boost/filesystem/path.hpp>

#include <string_view>

namespace pyshell {

/**
 * @brief Uniquely named file in the temporary directory, removed on destruction
 *
 * The file is created atomically so a name is never shared with
 * another file, even one created concurrently by another process.
 */
class TempScript
{
    boost::filesystem::path path_;

    explicit TempScript(boost::filesystem::path path) : path_{std::move(path)} {}

public:
    /**
     * @brief Create a temporary file holding the given contents
     *
     * @param contents File contents
     * @param prefix File name prefix
     * @param suffix File name suffix
     * @return owner of the new file
     * @throw std::system_error when the file can't be created or written
     */
    static auto create(std::string_view contents, std::string_view prefix = "pyshell", std::string_view suffix = ".py") -> TempScript;

    TempScript(TempScript const&) = delete;
    auto operator=(TempScript const&) -> TempScript& = delete;

    TempScript(TempScript&& other) noexcept : path_{std::move(other.path_)}
    {
        other.path_.clear();
    }

    auto operator=(TempScript&& other) noexcept -> TempScript&;

    ~TempScript();

    auto path() const -> boost::filesystem::path const& { return path_; }

private:
    auto remove() noexcept -> void;
};

} // namespace pyshell
