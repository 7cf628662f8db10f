// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <dnsrotor/dnsrotor.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>

namespace
{

/// \brief One-shot action requested on the command line.
struct Mode
{
  bool once = false;
  bool reset = false;
  bool get = false;
  std::optional<std::pair<std::string, std::string>> set;
};

/// \brief Print help message
void printHelp()
{
  std::cout
    << "Usage: dnsrotor [options]\n"
    << "Rotates the DNS resolvers of a network interface on a timer.\n\n"
    << "Options:\n"
    << "  -h, --help                  Show this help message\n"
    << "  -v, --version               Show version\n"
    << "  -c, --config <file>         Configuration file path\n"
    << "  -i, --interface <name>      Network interface (e.g. Wi-Fi, eth0; default: auto)\n"
    << "  -t, --interval <seconds>    Rotation interval (min "
    << dnsrotor::rotation::RotationController::MinRotationInterval << ", max "
    << dnsrotor::rotation::RotationController::MaxRotationInterval << ", default "
    << dnsrotor::core::Settings::DefaultInterval << ")\n"
    << "  -o, --once                  Rotate DNS once and exit\n"
    << "  -r, --reset                 Reset DNS to automatic configuration and exit\n"
    << "  -g, --get                   Display current DNS configuration and exit\n"
    << "  -s, --set <dns1> <dns2>     Set specific DNS servers and exit\n"
    << "  -l, --log-level <level>     Log level (trace, debug, info, warning, error, fatal)\n"
    << "  -f, --log-dir <dir>         Log directory\n"
    << "      --lock-file <path>      Instance lock file\n"
    << "      --platform <name>       DNS back-end (auto, macos, linux)\n";
}

std::int64_t parseInteger(const std::string &option, const std::string &value)
{
  try
  {
    std::size_t used = 0;
    long long parsed = std::stoll(value, &used);
    if (used != value.size())
    {
      throw std::invalid_argument(value);
    }
    return parsed;
  }
  catch (const std::exception &)
  {
    throw std::runtime_error("Invalid value for " + option + ": " + value);
  }
}

/// \brief Parse command line arguments
void parseCliArgs(int argc, char **argv, dnsrotor::core::Config &config, Mode &mode)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      config.configFile = argv[++i];
    }
    else if ((arg == "-i" || arg == "--interface") && i + 1 < argc)
    {
      config.general.interface = argv[++i];
    }
    else if ((arg == "-t" || arg == "--interval") && i + 1 < argc)
    {
      config.general.interval = parseInteger(arg, argv[++i]);
    }
    else if (arg == "-o" || arg == "--once")
    {
      mode.once = true;
    }
    else if (arg == "-r" || arg == "--reset")
    {
      mode.reset = true;
    }
    else if (arg == "-g" || arg == "--get")
    {
      mode.get = true;
    }
    else if ((arg == "-s" || arg == "--set") && i + 2 < argc)
    {
      std::string primary = argv[++i];
      std::string secondary = argv[++i];
      mode.set = std::make_pair(primary, secondary);
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      config.log.level = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-dir") && i + 1 < argc)
    {
      config.log.directory = argv[++i];
    }
    else if (arg == "--lock-file" && i + 1 < argc)
    {
      config.system.lockFile = argv[++i];
    }
    else if (arg == "--platform" && i + 1 < argc)
    {
      config.system.platform = argv[++i];
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      std::exit(0);
    }
    else if (arg == "-v" || arg == "--version")
    {
      std::cout << "dnsrotor " << DNSROTOR_VERSION << std::endl;
      std::exit(0);
    }
    else if (arg.length() > 0 && arg[0] == '-')
    {
      throw std::runtime_error("Unknown option or missing value: " + arg);
    }
    else
    {
      throw std::runtime_error("Unexpected argument: " + arg);
    }
  }
}

/// \brief Layer the TOML configuration under the command line values
void parseTomlConfig(dnsrotor::core::Config &config, const std::string &executablePath)
{
  std::unique_ptr<dnsrotor::core::ConfigLoader> configLoader;
  if (config.configFile)
  {
    // An explicit file must load; the exception reaches main.
    configLoader = std::make_unique<dnsrotor::core::ConfigLoader>(*config.configFile);
  }
  else if (auto found = dnsrotor::core::discoverConfigFile(executablePath))
  {
    try
    {
      configLoader = std::make_unique<dnsrotor::core::ConfigLoader>(*found);
    }
    catch (const std::exception &e)
    {
      dnsrotor::core::Logger::warning("Failed to load config from " + *found + ": " + e.what());
      return;
    }
  }
  else
  {
    dnsrotor::core::Logger::info("No configuration file found. Using defaults.");
    return;
  }

  dnsrotor::core::applyToml(config, *configLoader);
  dnsrotor::core::Logger::info("Loaded configuration from " + configLoader->filename());
}

/// \brief Rotate until the token is cancelled by SIGINT or SIGTERM
void runUntilSignalled(dnsrotor::rotation::RotationController &controller,
                       dnsrotor::core::CancellationToken &token)
{
  std::cout << "Starting continuous rotation every " << controller.effectiveInterval().count()
            << "s. Press Ctrl+C to stop." << std::endl;
  controller.runContinuous(token);
}

int run(int argc, char **argv)
{
  using namespace dnsrotor;

  core::Config config;
  Mode mode;
  parseCliArgs(argc, argv, config, mode);
  parseTomlConfig(config, argc > 0 ? argv[0] : "");

  core::Settings settings = core::Settings::fromConfig(config);
  settings.resolvePaths();

  core::Logger::init(settings.logLevel, settings.logFilePath(), settings.logRetentionDays,
                     settings.logConsole);
  if (settings.logFormat)
  {
    core::Logger::setLogFormat(*settings.logFormat);
  }

  // Before the lock and before any thread, so every mode shuts down through the watcher.
  system::SignalWatcher::blockShutdownSignals();

  system::InstanceLock lock(settings.lockFile);
  if (!lock.acquire())
  {
    std::cerr << "Error: Another instance of dnsrotor is already running." << std::endl
              << "Stop it first or wait for it to finish." << std::endl;
    return EXIT_FAILURE;
  }
  DNSROTOR_LOG_INFO("Lock acquired (PID " << lock.pid() << ") at " << lock.path());

  bool oneShot = mode.get || mode.reset || mode.set || mode.once;
  core::CancellationToken token;
  // Declared after the lock so it is joined before the lock goes away.
  system::SignalWatcher watcher(
    [&lock, &token, oneShot](int signo)
    {
      if (oneShot)
      {
        system::exitOnSignal(lock, signo);
      }
      token.cancel();
    });

  system::CommandDnsConfigurator configurator(settings.platform, settings.commandTimeout,
                                              settings.privilegePrefix);
  std::string iface =
    settings.autoDetectInterface() ? configurator.detectInterface() : settings.interface;

  dns::HealthCache cache(settings.cacheTtl, settings.probeTimeout);
  dns::SelectionPolicy policy(cache);
  rotation::RotationController controller(configurator, policy, settings.candidates, iface,
                                          settings.interval, settings.maxRetries);

  if (mode.get)
  {
    if (auto current = controller.getCurrent())
    {
      std::cout << "Current DNS: " << *current << std::endl;
    }
    else
    {
      std::cout << "Could not retrieve DNS configuration." << std::endl;
    }
    return EXIT_SUCCESS;
  }

  if (mode.reset)
  {
    return controller.reset() ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  if (mode.set)
  {
    dns::ResolverPair pair(mode.set->first, mode.set->second);
    return controller.setExplicit(pair) ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  if (mode.once)
  {
    return controller.rotateOnce() ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  runUntilSignalled(controller, token);
  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv)
{
  int status = EXIT_FAILURE;
  try
  {
    status = run(argc, argv);
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error: " << ex.what() << std::endl;
    status = EXIT_FAILURE;
  }

  dnsrotor::core::Logger::shutdown();
  return status;
}
