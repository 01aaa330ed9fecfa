#include "airline/config.hpp"

#include <fstream>
#include <sstream>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace airline {

namespace {

void add_retry_options(po::options_description& desc, const std::string& prefix, RetryPolicy& policy,
                       bool with_backoff) {
    desc.add_options()
        ((prefix + ".max_attempts").c_str(), po::value<int>(&policy.max_attempts)->default_value(policy.max_attempts),
         "attempts before giving up");
    if (with_backoff) {
        desc.add_options()
            ((prefix + ".backoff_min_ms").c_str(),
             po::value<int>(&policy.backoff_min_ms)->default_value(policy.backoff_min_ms),
             "shortest random backoff between attempts")
            ((prefix + ".backoff_max_ms").c_str(),
             po::value<int>(&policy.backoff_max_ms)->default_value(policy.backoff_max_ms),
             "longest random backoff between attempts");
    }
}

Status validate_retry(const std::string& name, const RetryPolicy& policy) {
    if (policy.max_attempts < 1) {
        return bad_request(name + ".max_attempts must be at least 1");
    }
    if (policy.backoff_min_ms < 0 || policy.backoff_min_ms > policy.backoff_max_ms) {
        return bad_request(name + " backoff range is invalid");
    }
    return Status();
}

} // namespace

Status validate(const EngineConfig& config) {
    if (config.store.path.empty()) return bad_request("store.path must not be empty");
    if (config.store.pool_size < 1) return bad_request("store.pool_size must be at least 1");
    if (config.store.acquire_timeout_ms < 0) return bad_request("store.acquire_timeout_ms must not be negative");
    if (config.store.busy_timeout_ms < 0) return bad_request("store.busy_timeout_ms must not be negative");

    Status st = validate_retry("ticket", config.ticket_retry);
    if (!st) return st;
    st = validate_retry("seat", config.seat_retry);
    if (!st) return st;
    return validate_retry("compensation", config.compensation_retry);
}

Result<EngineConfig> parse_config(int argc, const char* const argv[]) {
    EngineConfig config;
    std::string config_file;
    std::string level = "info";

    po::options_description generic("General");
    generic.add_options()
        ("help,h", "show this help")
        ("config,c", po::value<std::string>(&config_file), "INI-style config file");

    po::options_description engine("Engine");
    engine.add_options()
        ("store.path", po::value<std::string>(&config.store.path)->default_value(config.store.path),
         "SQLite database file")
        ("store.pool_size", po::value<int>(&config.store.pool_size)->default_value(config.store.pool_size),
         "maximum open connections")
        ("store.acquire_timeout_ms",
         po::value<int>(&config.store.acquire_timeout_ms)->default_value(config.store.acquire_timeout_ms),
         "wait for a free connection")
        ("store.busy_timeout_ms",
         po::value<int>(&config.store.busy_timeout_ms)->default_value(config.store.busy_timeout_ms),
         "wait on the database write lock")
        ("log.file", po::value<std::string>(&config.log_file), "log file (stderr when empty)")
        ("log.level", po::value<std::string>(&level)->default_value(level), "debug, info, warn, error or off");
    add_retry_options(engine, "ticket", config.ticket_retry, true);
    add_retry_options(engine, "seat", config.seat_retry, true);
    add_retry_options(engine, "compensation", config.compensation_retry, false);

    po::options_description all("Options");
    all.add(generic).add(engine);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, all), vm);

        // Read the file name before notify() so file values fill in what the command line left out
        if (vm.count("config")) {
            const std::string path = vm["config"].as<std::string>();
            std::ifstream in(path);
            if (!in) {
                return bad_request("Cannot open config file " + path);
            }
            po::store(po::parse_config_file(in, engine), vm);
        }
        po::notify(vm);
    } catch (const po::error& e) {
        return bad_request(std::string("Invalid option: ") + e.what());
    }

    if (vm.count("help")) {
        config.show_help = true;
        std::ostringstream os;
        os << all;
        config.usage = os.str();
        return config;
    }

    if (!try_parse_log_level(level, config.log_level)) {
        return bad_request("Unknown log level '" + level + "'");
    }

    Status st = validate(config);
    if (!st) return st.error();
    return config;
}

} // namespace airline
