#include <backend/main.hpp>

#include <log/log.hpp>

#include <nlohmann/json.hpp>

Main::Main(CommandLineOptions options, Persistence::Settings settings, CommandRunner& runner, std::ostream& output)
    : options_{std::move(options)}
    , backend_{
          IDriveBackend::IDriveBackendOptions{
              .settings = std::move(settings),
              .remoteUrl = options_.remoteUrl,
          },
          runner,
      }
    , output_{&output}
{}

int Main::run()
{
    const auto result = runCommand();
    backend_.close();

    if (!result)
    {
        Log::error("{} failed: {}", options_.command, result.error().toString());
        if (options_.json)
            *output_ << nlohmann::json(result.error()).dump(4) << "\n";
        return ExitCode::operationFailed;
    }
    return ExitCode::success;
}

std::expected<void, IDriveBackend::Error> Main::runCommand()
{
    auto const& args = options_.arguments;

    if (options_.command == "connect")
        return backend_.connect();
    if (options_.command == "put")
        return backend_.put(args[0], args[1]);
    if (options_.command == "get")
        return backend_.get(args[0], args[1]);
    if (options_.command == "list")
        return list();
    if (options_.command == "delete")
        return args.size() == 1 ? backend_.remove(args[0]) : backend_.removeMany(args);
    if (options_.command == "query")
        return query();

    return std::unexpected(IDriveBackend::Error{
        .type = SharedData::OperationErrorType::ImplementationError,
        .extraInfo = "Unhandled command " + options_.command,
    });
}

std::expected<void, IDriveBackend::Error> Main::list()
{
    const auto names = backend_.list();
    if (!names)
        return std::unexpected(names.error());

    if (options_.json)
    {
        *output_ << nlohmann::json(*names).dump(4) << "\n";
        return {};
    }
    for (auto const& name : *names)
        *output_ << name << "\n";
    return {};
}

std::expected<void, IDriveBackend::Error> Main::query()
{
    const auto sizes = backend_.queryMany(options_.arguments);
    if (!sizes)
        return std::unexpected(sizes.error());

    auto json = nlohmann::json::object();
    for (auto const& [name, result] : *sizes)
        json[name] = result;
    *output_ << json.dump(options_.json ? 4 : -1) << "\n";
    return {};
}
