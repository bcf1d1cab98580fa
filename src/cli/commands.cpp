#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "runblock/errors.hpp"
#include "runblock/run_block.hpp"
#include "utils/cancellation.hpp"
#include "utils/logging.hpp"

#ifndef MARGIN_VERSION
#define MARGIN_VERSION "dev"
#endif
#ifndef MARGIN_COMMIT
#define MARGIN_COMMIT "none"
#endif
#ifndef MARGIN_BUILD_DATE
#define MARGIN_BUILD_DATE "unknown"
#endif

namespace {

namespace po = boost::program_options;

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void ConfigureLogging(const margin::config::Config& config) {
    auto& log_config = margin::utils::GlobalLogConfig();
    log_config.min_level = margin::utils::ParseLogLevel(config.logging.level, log_config.min_level);
}

// Cancels source on SIGINT/SIGTERM until destroyed.
class SignalCanceller {
public:
    explicit SignalCanceller(margin::utils::CancellationSource& source)
        : signals_(ioc_, SIGINT, SIGTERM) {
        signals_.async_wait([&source](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            margin::utils::Log(margin::utils::LogLevel::kInfo, "cli",
                               "signal " + std::to_string(signal) + ", cancelling");
            source.Cancel();
        });
        thread_ = std::thread([this]() { ioc_.run(); });
    }

    ~SignalCanceller() {
        boost::system::error_code ignored;
        signals_.cancel(ignored);
        ioc_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_;
    std::thread thread_;
};

int HandleVersion() {
    nlohmann::json json = {
        {"version", MARGIN_VERSION},
        {"commit", MARGIN_COMMIT},
        {"date", MARGIN_BUILD_DATE}
    };
    std::cout << json.dump(2) << std::endl;
    return 0;
}

int HandleRunBlock(const std::vector<std::string>& args) {
    po::options_description desc("run-block options");
    desc.add_options()
        ("file", po::value<std::string>(), "markdown document to read")
        ("cursor", po::value<long long>()->default_value(0), "byte offset of the cursor")
        ("root", po::value<std::string>(), "margin root directory")
        ("config", po::value<std::string>(), "config file (default <root>/config.json)")
        ("timeout", po::value<long long>(), "execution timeout in seconds");
    const po::positional_options_description no_positionals;

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(args)
                      .options(desc)
                      .positional(no_positionals)
                      .style(po::command_line_style::default_style |
                             po::command_line_style::allow_long_disguise)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& ex) {
        std::cerr << "run-block: " << ex.what() << "\n" << desc;
        return kExitUsage;
    }
    auto get = [&](const char* name) {
        return vm.count(name) > 0 ? vm[name].as<std::string>() : std::string();
    };

    const auto file = get("file");
    if (file.empty()) {
        std::cerr << "--file required" << std::endl;
        return kExitUsage;
    }
    const auto cursor = vm["cursor"].as<long long>();
    if (cursor < 0) {
        std::cerr << "invalid --cursor: " << cursor << std::endl;
        return kExitUsage;
    }
    std::optional<long long> timeout_s;
    if (vm.count("timeout") > 0) {
        timeout_s = vm["timeout"].as<long long>();
        if (*timeout_s <= 0 || *timeout_s > margin::config::kMaxTimeoutSeconds) {
            std::cerr << "invalid --timeout: " << *timeout_s << " (1.."
                      << margin::config::kMaxTimeoutSeconds << " seconds)" << std::endl;
            return kExitUsage;
        }
    }

    margin::config::Config config;
    try {
        const auto root = get("root");
        config = margin::config::LoadConfig(
            root.empty() ? margin::config::DefaultRoot() : std::filesystem::path(root),
            std::filesystem::path(get("config")));
    } catch (const margin::config::ConfigError& ex) {
        std::cerr << "run-block: " << ex.what() << std::endl;
        return kExitFailure;
    }
    ConfigureLogging(config);

    margin::runblock::ExecutionOptions options;
    options.timeout = std::chrono::seconds(timeout_s ? *timeout_s : config.runblock.timeout_s);

    margin::utils::CancellationSource cancel;
    SignalCanceller canceller(cancel);
    try {
        const auto result = margin::runblock::Run(
            file,
            static_cast<std::size_t>(cursor),
            config.runblock,
            cancel.Token(),
            options);
        std::cout << margin::runblock::ResultToJson(result) << std::endl;
    } catch (const margin::runblock::RunBlockError& ex) {
        margin::utils::Log(margin::utils::LogLevel::kDebug, "cli",
                           std::string("error kind=") + margin::runblock::ToString(ex.kind()));
        std::cerr << "run-block: " << ex.what() << std::endl;
        return kExitFailure;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        return HandleVersion();
    }
    const std::string sub = argv[1];
    if (sub == "version" || sub == "--version" || sub == "-v") {
        return HandleVersion();
    }
    const std::vector<std::string> args(argv + 2, argv + argc);
    if (sub == "run-block") {
        return HandleRunBlock(args);
    }
    std::cerr << "unknown subcommand: " << sub << std::endl;
    std::cerr << "Usage: margin version | margin run-block --file <path> [--cursor <n>] "
                 "[--root <dir>] [--config <path>] [--timeout <seconds>]" << std::endl;
    return kExitUsage;
}
