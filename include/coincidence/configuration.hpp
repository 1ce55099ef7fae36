#pragma once

#include <coincidence/common.hpp>

#include <span>
#include <string>
#include <string_view>

namespace coincidence {

// => If hardcoded defaults are desired, the config object is designed to use multiple default sources and a shared defaults object could be added.

class Configuration {
public:
    /*
     * Create the project configuration directory if it doesn't exist.
     *
     * Returns true if a new directory was created.
     */
    static bool init();

    /*
     * Open a configuration file, project-local unless user_wide is set.
     * A project-local file falls back to the user-wide file of the same name.
     */
    Configuration(std::span<std::string_view const> subpath, bool user_wide = false);

    Configuration(Configuration const&) = delete;
    Configuration& operator=(Configuration const&) = delete;

    /*
     * Accessor for configuration values within a configuration file.
     *
     * {"section", "key"} addresses [section] key.
     */
    std::string & operator[](std::span<std::string_view const> locator);

    /*
     * Destructor; writes the file back if any value was changed.
     */
    ~Configuration();

    /*
     * Get a per-project configuration path.
     * Throws std::invalid_argument if there is no project directory.
     */
    static std::string_view path_local(std::span<std::string_view const> subpath = {}, bool is_dir = false);

    /*
     * Get a per-user configuration path.
     */
    static std::string_view path_user(std::span<std::string_view const> subpath = {}, bool is_dir = false);

    /*
     * Get a per-project path if there is a project directory, otherwise per-user.
     */
    static std::string_view path_default(std::span<std::string_view const> subpath = {}, bool is_dir = false);

    static bool has_local();

private:
    void* impl_;
};

} // namespace coincidence
