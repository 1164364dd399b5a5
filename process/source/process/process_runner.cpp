#include <process/process_runner.hpp>
#include <process/boost_process.hpp>

#include <log/log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/system/system_error.hpp>

#include <unordered_map>

namespace bp2 = boost::process::v2;

ProcessRunner::ProcessRunner(std::optional<Environment> environment)
    : environment_{environment ? std::move(environment).value() : Environment::current()}
{}

std::expected<SharedData::CommandResult, std::string> ProcessRunner::run(CommandLine const& commandLine)
{
    std::unordered_map<bp2::environment::key, bp2::environment::value> env;
    for (auto const& [key, value] : environment_.environment())
    {
        if (key.empty() || value.empty())
            continue;
        env.emplace(key, value);
    }

    auto executable = commandLine.executable;
    if (!executable.has_parent_path())
    {
        const auto found = bp2::environment::find_executable(executable.string(), env);
        if (!found.empty())
            executable = found.string();
    }

    boost::asio::io_context context{};
    boost::asio::readable_pipe stdoutPipe{context};
    boost::asio::readable_pipe stderrPipe{context};

    SharedData::CommandResult result{};
    try
    {
        bp2::process child{
            context,
            executable.string(),
            commandLine.arguments,
            bp2::process_environment{env},
            bp2::process_stdio{
                .in = nullptr,
                .out = stdoutPipe,
                .err = stderrPipe,
            }};

        // Both pipes are drained concurrently, a child blocked on a full stderr pipe would never close stdout.
        boost::asio::async_read(
            stdoutPipe,
            boost::asio::dynamic_buffer(result.standardOutput),
            [](boost::system::error_code ec, std::size_t) {
                if (ec && ec != boost::asio::error::eof)
                    Log::debug("ProcessRunner: Reading stdout ended with: {}", ec.message());
            });
        boost::asio::async_read(
            stderrPipe,
            boost::asio::dynamic_buffer(result.standardError),
            [](boost::system::error_code ec, std::size_t) {
                if (ec && ec != boost::asio::error::eof)
                    Log::debug("ProcessRunner: Reading stderr ended with: {}", ec.message());
            });

        context.run();

        boost::system::error_code waitError;
        const int exitCode = child.wait(waitError);
        if (waitError)
        {
            Log::warn("ProcessRunner: Waiting for '{}' failed: {}", executable.string(), waitError.message());
            return result;
        }
        result.exitStatus = exitCode;
    }
    catch (boost::system::system_error const& exc)
    {
        return std::unexpected(
            std::string{"Failed to start '"} + commandLine.executable.string() + "': " + exc.what());
    }

    return result;
}
