#include "plugctl/app_config.hpp"
#include "plugctl/commands.hpp"
#include "plugctl/logging.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

const char* const USAGE =
    "Usage: plugctl [options] <command> [command options]\n"
    "\n"
    "Commands:\n"
    "  discover      Listen for plug broadcasts\n"
    "  on            Turn a plug on\n"
    "  off           Turn a plug off\n"
    "  status        Show state and power consumption\n"
    "  rename        Change the name a plug advertises\n"
    "  pair          Give a device an alias\n"
    "  unpair        Remove an alias\n"
    "  list-paired   List paired devices\n"
    "  clear-cache   Delete the store file\n";

po::options_description targetOptions() {
    po::options_description desc("Device options");
    desc.add_options()
        ("ip,i", po::value<std::string>(), "Device IP address")
        ("device-id,d", po::value<std::string>(), "Device ID")
        ("alias,a", po::value<std::string>(), "Paired device alias");
    return desc;
}

plugctl::TargetOptions readTarget(const po::variables_map& vm) {
    plugctl::TargetOptions target;
    if (vm.count("ip")) {
        target.ipAddress = vm["ip"].as<std::string>();
    }
    if (vm.count("device-id")) {
        target.deviceId = vm["device-id"].as<std::string>();
    }
    if (vm.count("alias")) {
        target.alias = vm["alias"].as<std::string>();
    }
    return target;
}

po::variables_map parseCommand(const po::options_description& desc, const std::vector<std::string>& args) {
    po::variables_map vm;
    po::store(po::command_line_parser(args).options(desc).run(), vm);
    po::notify(vm);
    return vm;
}

int runCommand(plugctl::CommandRunner& runner,
               const std::string& command,
               const std::vector<std::string>& args,
               bool verbose) {
    if (command == "discover") {
        po::options_description desc("discover options");
        desc.add_options()
            ("timeout,t", po::value<uint64_t>()->default_value(30), "Listen duration in seconds")
            ("no-cache", po::bool_switch()->default_value(false), "Disable device caching")
            ("cache-timeout", po::value<uint64_t>()->default_value(3600), "Cache timeout in seconds")
            ("cache-only", po::bool_switch()->default_value(false), "Only use cached devices, don't scan network");
        auto vm = parseCommand(desc, args);

        plugctl::DiscoverOptions options;
        options.timeout = std::chrono::seconds(vm["timeout"].as<uint64_t>());
        options.noCache = vm["no-cache"].as<bool>();
        options.cacheTimeout = std::chrono::seconds(vm["cache-timeout"].as<uint64_t>());
        options.cacheOnly = vm["cache-only"].as<bool>();
        return runner.discover(options);
    }

    if (command == "on" || command == "off" || command == "status") {
        auto vm = parseCommand(targetOptions(), args);
        const auto target = readTarget(vm);
        if (command == "on") {
            return runner.turnOn(target);
        }
        if (command == "off") {
            return runner.turnOff(target);
        }
        return runner.status(target);
    }

    if (command == "rename") {
        po::options_description desc = targetOptions();
        desc.add_options()
            ("new-name,n", po::value<std::string>()->required(), "New name for the device");
        auto vm = parseCommand(desc, args);
        return runner.rename(readTarget(vm), vm["new-name"].as<std::string>());
    }

    if (command == "pair") {
        po::options_description desc("pair options");
        desc.add_options()
            ("device-id,d", po::value<std::string>()->required(), "Device ID to pair")
            ("alias,a", po::value<std::string>()->required(), "Friendly alias for the device");
        auto vm = parseCommand(desc, args);
        return runner.pair(vm["device-id"].as<std::string>(), vm["alias"].as<std::string>());
    }

    if (command == "unpair") {
        po::options_description desc("unpair options");
        desc.add_options()
            ("alias,a", po::value<std::string>()->required(), "Alias of the paired device to remove")
            ("force", po::bool_switch()->default_value(false), "Remove without confirmation");
        auto vm = parseCommand(desc, args);
        return runner.unpair(vm["alias"].as<std::string>(), vm["force"].as<bool>());
    }

    if (command == "list-paired") {
        parseCommand(po::options_description("list-paired options"), args);
        return runner.listPaired(verbose);
    }

    if (command == "clear-cache") {
        po::options_description desc("clear-cache options");
        desc.add_options()
            ("force", po::bool_switch()->default_value(false), "Clear cache without confirmation");
        auto vm = parseCommand(desc, args);
        return runner.clearCache(vm["force"].as<bool>());
    }

    std::cerr << "Unknown command: " << command << "\n\n" << USAGE;
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        po::options_description global("Global options");
        global.add_options()
            ("help,h", "Print help message")
            ("verbose,v", po::bool_switch()->default_value(false), "Enable verbose logging")
            ("debug", po::bool_switch()->default_value(false), "Enable debug logging")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("store", po::value<std::string>(), "Store file (default: switcher_config.json beside the executable)")
            ("command", po::value<std::string>(), "Command to run")
            ("args", po::value<std::vector<std::string>>(), "Command arguments");

        po::positional_options_description positional;
        positional.add("command", 1).add("args", -1);

        po::parsed_options parsed = po::command_line_parser(argc, argv)
            .options(global)
            .positional(positional)
            .allow_unregistered()
            .run();

        po::variables_map vm;
        po::store(parsed, vm);
        po::notify(vm);

        if (vm.count("help") || !vm.count("command")) {
            std::cout << USAGE << "\n" << global << std::endl;
            return vm.count("help") ? 0 : 1;
        }

        const std::string command = vm["command"].as<std::string>();
        std::vector<std::string> commandArgs = po::collect_unrecognized(parsed.options, po::include_positional);
        // The command name itself is the first positional token
        commandArgs.erase(commandArgs.begin());

        plugctl::AppConfig config;
        if (vm.count("config")) {
            config = plugctl::Config::loadAppConfig(vm["config"].as<std::string>());
        }
        if (vm.count("store")) {
            config.store.path = vm["store"].as<std::string>();
        }

        plugctl::LoggingOptions logging;
        logging.verbose = vm["verbose"].as<bool>();
        logging.debug = vm["debug"].as<bool>();
        logging.logFile = config.logging.file;
        plugctl::setupLogging(logging);

        spdlog::info("Starting plugctl {}", PLUGCTL_VERSION);
        spdlog::debug("CLI arguments parsed: command={}, verbose={}, debug={}",
                      command, logging.verbose, logging.debug);

        plugctl::CommandRunner runner(config,
                                      plugctl::CommandRunner::defaultDependencies(config),
                                      std::cout,
                                      std::cin);
        return runCommand(runner, command, commandArgs, logging.verbose);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << USAGE;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
