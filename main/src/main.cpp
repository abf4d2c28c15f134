#include "config.hpp"
#include "exception.hpp"
#include "http.hpp"
#include "localization.hpp"
#include "resilience.hpp"
#include "session.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {
    void print_usage(const cxxopts::Options& options) {
        std::cerr << options.help({""});
        std::cerr << get_string("info.commands") << std::endl;
        std::cerr << get_string("info.get_desc") << std::endl;
        std::cerr << get_string("info.put_desc") << std::endl;
        std::cerr << get_string("info.put_dir_desc") << std::endl;
        std::cerr << get_string("info.exists_desc") << std::endl;
        std::cerr << get_string("info.list_desc") << std::endl;
        std::cerr << get_string("info.refresh_desc") << std::endl;
    }

    void pre_operation_check(const std::vector<std::string>& args, const std::function<void()>& print_usage_func,
                             size_t min, std::optional<size_t> max = std::nullopt) {
        if (args.size() < min || (max.has_value() && args.size() > max.value())) {
            print_usage_func();
            throw GhrelException(get_string("error.invalid_arg_count"));
        }
    }

    int put_directory(RepositorySession& session, const fs::path& source_dir, const std::string& prefix) {
        if (!fs::is_directory(source_dir)) {
            throw GhrelException(string_format("error.path_not_dir", source_dir.string()));
        }
        std::vector<fs::path> files;
        for (const auto& entry : fs::recursive_directory_iterator(source_dir)) {
            if (entry.is_regular_file()) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        for (const auto& file : files) {
            std::string relative = fs::relative(file, source_dir).generic_string();
            std::string target = prefix.empty() ? relative : prefix + "/" + relative;
            session.write_resource(target, read_file_bytes(file));
            log_info(string_format("info.staged", target));
        }
        return static_cast<int>(files.size());
    }
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("t,token", get_string("help.token"), cxxopts::value<std::string>())
            ("c,config", get_string("help.config"), cxxopts::value<std::string>())
            ("cache-dir", get_string("help.cache_dir"), cxxopts::value<std::string>())
            ("api-endpoint", get_string("help.api_endpoint"), cxxopts::value<std::string>())
            ("upload-endpoint", get_string("help.upload_endpoint"), cxxopts::value<std::string>())
            ("o,output", get_string("help.output_file"), cxxopts::value<std::string>())
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("args", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "args"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }
        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        set_verbose_mode(result["verbose"].as<bool>());
        init_filesystem();

        fs::path config_file = result.count("config") ? fs::path(result["config"].as<std::string>()) : CONFIG_FILE;
        Settings settings = load_settings(config_file);
        if (result.count("cache-dir")) {
            settings.cache_dir = result["cache-dir"].as<std::string>();
        }
        if (result.count("api-endpoint")) {
            apply_setting(settings, "api.endpoint", result["api-endpoint"].as<std::string>());
        }
        if (result.count("upload-endpoint")) {
            apply_setting(settings, "upload.endpoint", result["upload-endpoint"].as<std::string>());
        }
        std::string credential = result.count("token") ? result["token"].as<std::string>() : "";

        const std::string& command = result["command"].as<std::string>();
        std::vector<std::string> args;
        if (result.count("args")) {
            args = result["args"].as<std::vector<std::string>>();
        }
        auto usage_printer = [&]() { print_usage(options); };

        SystemClock clock;
        CurlTransport transport(settings.connect_timeout, settings.read_timeout);
        ResilientExecutor executor(settings.retry, settings.circuit_breaker, settings.rate_limit, clock);
        RepositorySession session(settings, transport, executor, clock);

        if (command == "get") {
            pre_operation_check(args, usage_printer, 2, 2);
            set_quiet_mode(!result.count("output"));
            session.open(args[0], credential);
            auto content = session.read_resource(args[1]);
            session.close();
            if (!content) {
                log_error(string_format("error.resource_not_found", args[1]));
                return 1;
            }
            if (result.count("output")) {
                write_file_atomic(result["output"].as<std::string>(), *content);
            } else {
                std::cout.write(content->data(), static_cast<std::streamsize>(content->size()));
                std::cout.flush();
            }
        } else if (command == "put") {
            pre_operation_check(args, usage_printer, 3, 3);
            std::string content = read_file_bytes(args[1]);
            session.open(args[0], credential);
            session.write_resource(args[2], std::move(content));
            session.close();
            log_info(string_format("info.put_complete", args[2]));
        } else if (command == "put-dir") {
            pre_operation_check(args, usage_printer, 2, 3);
            session.open(args[0], credential);
            int count = put_directory(session, args[1], args.size() > 2 ? args[2] : "");
            session.close();
            log_info(string_format("info.put_dir_complete", count));
        } else if (command == "exists") {
            pre_operation_check(args, usage_printer, 2, 2);
            session.open(args[0], credential);
            bool found = session.resource_exists(args[1]);
            session.close();
            std::cout << (found ? "yes" : "no") << std::endl;
            return found ? 0 : 1;
        } else if (command == "list") {
            pre_operation_check(args, usage_printer, 1, 2);
            session.open(args[0], credential);
            for (const auto& name : session.list_resources(args.size() > 1 ? args[1] : "")) {
                std::cout << name << std::endl;
            }
            session.close();
        } else if (command == "refresh") {
            pre_operation_check(args, usage_printer, 1, 1);
            session.open(args[0], credential);
            bool refreshed = session.refresh_if_newer();
            session.close();
            log_info(get_string(refreshed ? "info.refreshed" : "info.up_to_date"));
        } else {
            usage_printer();
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const GhrelException& e) {
        log_error(string_format("error.ghrel_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
