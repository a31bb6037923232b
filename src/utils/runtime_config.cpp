#include "wirehdr/utils/runtime_config.hpp"

namespace wirehdr::utils {

void RuntimeConfig::register_defaults(ConfigLoader& loader) {
    loader.load_defaults({
        {"log.level", std::string("warning")},
        {"log.console", true},
        {"log.file", std::string()},
        {"log.format", std::string("text")},
        {"io.timeout_ms", int64_t{0}},
    });
}

RuntimeConfig RuntimeConfig::from_loader(const ConfigLoader& loader) {
    RuntimeConfig cfg{};
    cfg.log_level = log_utils::parse_log_level(loader.get_string("log.level", "warning"));
    cfg.log_to_console = loader.get_bool("log.console", true);
    cfg.log_file = loader.get_string("log.file");
    cfg.log_json = loader.get_string("log.format", "text") == "json";
    int64_t ms = loader.get_int("io.timeout_ms", 0);
    cfg.io_timeout = std::chrono::milliseconds{ms < 0 ? 0 : ms};
    return cfg;
}

RuntimeConfig RuntimeConfig::load(int argc, char* argv[]) {
    ConfigLoader loader;
    register_defaults(loader);
    loader.load_from_environment(kEnvPrefix);
    loader.load_from_command_line(argc, argv);
    return from_loader(loader);
}

void apply_logging(const RuntimeConfig& cfg) {
    log_utils::setup_basic_logging(cfg.log_level, cfg.log_to_console, cfg.log_file, cfg.log_json);
}

} // namespace wirehdr::utils
