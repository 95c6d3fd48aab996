#include "app_constants.hpp"
#include "config/config_loader.hpp"
#include "config/config_types.hpp"
#include "fs/file_system_factory.hpp"
#include "store/store_manager.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

int StatFile(S3Fs::Fs::IFile &file)
{
    const auto &stat    = file.Stat();
    std::time_t mod_time = std::chrono::system_clock::to_time_t(stat.ModTime());
    std::tm mod_tm{};
    gmtime_r(&mod_time, &mod_tm);

    std::cout << "name:     " << stat.Name() << '\n'
              << "size:     " << stat.Size() << '\n'
              << "mode:     " << std::oct << stat.Mode() << std::dec << '\n'
              << "modified: " << std::put_time(&mod_tm, "%Y-%m-%d %H:%M:%S UTC") << '\n'
              << "is_dir:   " << std::boolalpha << stat.IsDir() << std::endl;
    return EXIT_SUCCESS;
}

int CatFile(S3Fs::Fs::IFile &file)
{
    std::vector<std::byte> buffer(S3Fs::Constants::STREAM_CHUNK_SIZE);
    std::size_t total = 0;

    for (;;) {
        auto res = file.Read(buffer);
        std::cout.write(
            reinterpret_cast<const char *>(buffer.data()),
            static_cast<std::streamsize>(res.bytes_read)
        );
        total += res.bytes_read;

        if (res.error == S3Fs::Fs::FileErrc::EndOfFile ||
            res.error == S3Fs::Fs::FileErrc::UnexpectedEof) {
            break;
        }
        if (res.error) {
            spdlog::critical(
                "Error reading '{}' after {} bytes: {}", file.Stat().Name(), total,
                res.error.message()
            );
            return EXIT_FAILURE;
        }
    }
    std::cout.flush();
    spdlog::debug("Streamed {} bytes of '{}'", total, file.Stat().Name());
    return std::cout ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // anonymous namespace

int main(int argc, char *argv[])
{
    // Command Line argument parsing
    CLI::App app{std::string(S3Fs::Constants::APP_NAME)};
    app.require_subcommand(1);

    std::string config_path_str;
    std::string range_str;
    std::string object_name;

    app.add_option("-c,--config", config_path_str, "Path to the configuration JSON file")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option(
        "-r,--range", range_str, "Inclusive byte range START-END, overrides the configured range"
    );

    auto *stat_cmd = app.add_subcommand("stat", "Print the metadata of an object");
    stat_cmd->add_option("name", object_name, "Object name, only its base name is used")
        ->required();
    auto *cat_cmd = app.add_subcommand("cat", "Stream an object to stdout");
    cat_cmd->add_option("name", object_name, "Object name, only its base name is used")
        ->required();

    app.set_version_flag("-v,--version", std::string(S3Fs::Constants::APP_VERSION_STRING));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    // Logs go to stderr so `cat` output stays clean
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(std::string(S3Fs::Constants::DEFAULT_CONSOLE_LOG_PATTERN));
        auto main_logger =
            std::make_shared<spdlog::logger>(std::string(S3Fs::Constants::APP_NAME), console_sink);
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(S3Fs::Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(S3Fs::Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    spdlog::debug("{} starting...", S3Fs::Constants::APP_NAME);

    // Load Configuration
    std::filesystem::path config_path(config_path_str);
    auto config_result = S3Fs::Config::loadConfigFromFileVerbose(config_path);

    if (!config_result) {
        spdlog::critical("Error loading configuration: {}", config_result.error());
        return EXIT_FAILURE;
    }
    auto &config = config_result.value();

    spdlog::set_level(config.global_settings.log_level);

    if (!range_str.empty()) {
        auto range_opt = S3Fs::Config::ParseRangeString(range_str);
        if (!range_opt) {
            spdlog::critical("Invalid --range '{}', expected START-END", range_str);
            return EXIT_FAILURE;
        }
        config.range = *range_opt;
    }

    // Setup Core Components
    std::unique_ptr<S3Fs::Store::StoreManager> store_manager;
    try {
        store_manager = std::make_unique<S3Fs::Store::StoreManager>(config.store_definition);
    } catch (const std::exception &e) {
        spdlog::critical("Error initializing components: {}", e.what());
        return EXIT_FAILURE;
    }

    auto init_res = store_manager->Initialize();
    if (!init_res) {
        spdlog::critical("Error initializing object store: {}", init_res.error().message());
        return EXIT_FAILURE;
    }

    int exit_code = EXIT_FAILURE;
    {
        auto fs_res = S3Fs::Fs::FileSystemFactory::Create(store_manager->GetStore(), config.range);
        if (!fs_res) {
            spdlog::critical("Error creating file system: {}", fs_res.error().message());
        } else {
            auto file_res = fs_res.value()->Open(object_name);
            if (!file_res) {
                spdlog::critical(
                    "Cannot open '{}': {} (errno {})", object_name, file_res.error().message(),
                    S3Fs::Fs::ErrorToErrno(file_res.error())
                );
            } else {
                auto &file = *file_res.value();
                exit_code  = stat_cmd->parsed() ? StatFile(file) : CatFile(file);

                auto close_res = file.Close();
                if (!close_res) {
                    spdlog::error(
                        "Error closing '{}': {}", object_name, close_res.error().message()
                    );
                    exit_code = EXIT_FAILURE;
                }
            }
        }
    }

    auto shutdown_res = store_manager->Shutdown();
    if (!shutdown_res) {
        spdlog::error("Error shutting down object store: {}", shutdown_res.error().message());
    }

    spdlog::debug("{} exiting...", S3Fs::Constants::APP_NAME);
    spdlog::shutdown();

    return exit_code;
}
