#include <coincidence/log.hpp>
#include <coincidence/configuration.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace coincidence {

static std::tm & launch_time()
{
    static struct LaunchTime : public std::tm
    {
        LaunchTime()
        {
            auto now = std::chrono::system_clock::now();
            std::time_t now_time_t = std::chrono::system_clock::to_time_t(now);
            localtime_r(&now_time_t, this);
        }
    } launch_tm;
    return launch_tm;
}

static std::ofstream & logf()
{
    static struct LogStream : public std::ofstream
    {
        LogStream()
        {
            std::stringstream logfn_ss;
            logfn_ss << std::put_time(&launch_time(), "%FT%TZ.log");
            try {
                open(std::string(Configuration::path_default(coincidence::span<std::string_view>({
                    "logs",
                    logfn_ss.view()
                }))));
            } catch (std::runtime_error const& e) {
                // no configuration directory to log into; the stream stays closed
                std::cerr << "Logging disabled: " << e.what() << std::endl;
            }
        }
    } logf;
    return logf;
}

void Log::log(std::span<StringViewPair const> fields)
{
    boost::json::object obj;

    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    for (auto&& [key, value] : fields) {
        obj[key] = value;
    }

    obj["ts"] = (double)now_ms / 1000.0;

    static std::mutex mtx;
    std::lock_guard<std::mutex> lock(mtx);
    logf() << obj << std::endl;
}

static struct EnsureLaunchTimeCreated
{
    EnsureLaunchTimeCreated()
    { launch_time(); }
} ensure_launchtime_created;

} // namespace coincidence
