#include "roon_mpris/core/application.hpp"
#include "roon_mpris/core/configuration_service.hpp"
#include "roon_mpris/utils/logger.hpp"
#include "version.h"

#include <QApplication>
#include <QCommandLineParser>
#include <QTimer>

#include <atomic>
#include <csignal>
#include <iostream>

namespace {
    std::atomic<bool> g_shutdown_requested{false};

    void handle_shutdown_signal(int /*signal*/) {
        g_shutdown_requested = true;
    }

    void register_signal_handlers() {
        std::signal(SIGINT, handle_shutdown_signal);
        std::signal(SIGTERM, handle_shutdown_signal);
    }

    std::unique_ptr<roon_mpris::utils::Logger> setup_logging(roon_mpris::utils::LogLevel log_level,
                                                             const std::filesystem::path& config_dir) {
        using namespace roon_mpris::utils;

        auto logger = std::make_unique<Logger>(log_level);
        logger->add_sink(std::make_unique<ConsoleSink>(true));

        auto log_path = config_dir / "roon-mpris.log";
        auto file_sink = std::make_unique<FileSink>(log_path, false);
        if (file_sink->is_open()) {
            logger->add_sink(std::move(file_sink));
            std::cerr << "Logging to: " << log_path << std::endl;
        }

        return logger;
    }

    void setup_qt_application(QApplication& app) {
        app.setApplicationName("roon-mpris");
        app.setApplicationDisplayName("Roon MPRIS");
        app.setApplicationVersion(ROON_MPRIS_VERSION_STRING);
        app.setOrganizationName("8bitcloud");
        app.setQuitOnLastWindowClosed(false);
        app.setDesktopFileName("roon-mpris");
    }

    struct ParsedArguments {
        roon_mpris::core::ApplicationOptions options;
        bool exit = false;
        int exit_code = 0;
    };

    ParsedArguments parse_arguments(const QApplication& app) {
        ParsedArguments parsed;

        QCommandLineParser parser;
        parser.setApplicationDescription("Exposes a Roon zone as an MPRIS media player");

        // -h belongs to --host, so help only has the long form
        QCommandLineOption help_option(QStringList{"help"}, "Displays help on commandline options.");
        QCommandLineOption host_option(QStringList{"h", "host"},
            "Hostname to connect to, rather than using Roon discovery.", "host");
        QCommandLineOption port_option(QStringList{"p", "port"},
            "The port to connect to when connecting directly to a host (default 9100).", "port");
        QCommandLineOption config_option(QStringList{"c", "config"},
            "Where the app's configuration will be stored. Created if it does not exist.", "dir");
        QCommandLineOption log_option(QStringList{"l", "log"},
            "The amount of Roon logging to output: none or all.", "level");
        QCommandLineOption log_level_option(QStringList{"log-level"},
            "Application log level: debug, info, warning, error or none.", "level");

        parser.addOption(help_option);
        parser.addVersionOption();
        parser.addOption(host_option);
        parser.addOption(port_option);
        parser.addOption(config_option);
        parser.addOption(log_option);
        parser.addOption(log_level_option);

        if (!parser.parse(app.arguments())) {
            std::cerr << parser.errorText().toStdString() << "\n\n" << parser.helpText().toStdString();
            parsed.exit = true;
            parsed.exit_code = 1;
            return parsed;
        }

        if (parser.isSet(help_option)) {
            std::cout << parser.helpText().toStdString();
            parsed.exit = true;
            return parsed;
        }
        if (parser.isSet("version")) {
            std::cout << "roon-mpris " << ROON_MPRIS_VERSION_STRING << std::endl;
            parsed.exit = true;
            return parsed;
        }

        auto& options = parsed.options;
        options.config_directory = parser.isSet(config_option)
            ? std::filesystem::path(parser.value(config_option).toStdString())
            : roon_mpris::core::ConfigurationService::default_config_directory();

        if (parser.isSet(host_option)) {
            options.host = parser.value(host_option).toStdString();
        }
        if (parser.isSet(port_option)) {
            bool ok = false;
            int port = parser.value(port_option).toInt(&ok);
            if (!ok || port < 1 || port > 65535) {
                std::cerr << "Invalid port: " << parser.value(port_option).toStdString() << std::endl;
                parsed.exit = true;
                parsed.exit_code = 1;
                return parsed;
            }
            options.port = port;
        }
        if (parser.isSet(log_option)) {
            options.log_traffic = parser.value(log_option) == "all";
        }
        if (parser.isSet(log_level_option)) {
            auto level = roon_mpris::utils::parse_log_level(parser.value(log_level_option).toStdString());
            if (!level) {
                std::cerr << "Invalid log level: " << parser.value(log_level_option).toStdString() << std::endl;
                parsed.exit = true;
                parsed.exit_code = 1;
                return parsed;
            }
            options.log_level = *level;
        }

        return parsed;
    }
} // anonymous namespace

int main(int argc, char* argv[]) {
    QApplication qt_app(argc, argv);
    setup_qt_application(qt_app);

    auto parsed = parse_arguments(qt_app);
    if (parsed.exit) {
        return parsed.exit_code;
    }
    const auto& options = parsed.options;

    std::error_code ec;
    std::filesystem::create_directories(options.config_directory, ec);
    if (ec) {
        std::cerr << "Cannot create " << options.config_directory << ": " << ec.message() << std::endl;
        return 1;
    }

    auto config_service = roon_mpris::core::ConfigurationService::create(options.config_directory);
    if (!config_service->load()) {
        std::cerr << "Using default configuration" << std::endl;
    }

    const auto config = options.apply_to(config_service->get());
    auto logger = setup_logging(config.log_level, options.config_directory);
    roon_mpris::utils::LoggerManager::set_instance(std::move(logger));

    LOG_INFO("Main", std::string("roon-mpris v") + ROON_MPRIS_VERSION_STRING + " starting...");
    LOG_DEBUG("Main", "Log level: " + roon_mpris::utils::to_string(config.log_level));

    register_signal_handlers();

    try {
        LOG_DEBUG("Main", "Creating application...");
        auto app_result = roon_mpris::core::create_application(options);
        if (!app_result) {
            LOG_ERROR("Main", "Application creation failed");
            return 1;
        }

        auto app = std::move(*app_result);

        if (!app->initialize()) {
            LOG_ERROR("Main", "Application initialization failed");
            return 1;
        }

        if (!app->start()) {
            LOG_ERROR("Main", "Application start failed");
            return 1;
        }

        QTimer signal_timer;
        QObject::connect(&signal_timer, &QTimer::timeout, [&app]() {
            if (g_shutdown_requested) {
                LOG_INFO("Main", "Shutdown signal received");
                app->quit();
            }
        });
        signal_timer.start(200);

        qt_app.exec();

        LOG_INFO("Main", "Shutting down...");
        app->stop();
        app->shutdown();

        LOG_INFO("Main", "Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Main", "Fatal: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
