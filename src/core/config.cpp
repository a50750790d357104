/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>

namespace exec_engine {

namespace {

std::vector<std::string> read_string_array(const toml::node_view<toml::node>& node) {
    std::vector<std::string> out;
    if (auto* arr = node.as_array()) {
        for (const auto& elem : *arr) {
            if (auto str = elem.value<std::string>()) {
                out.push_back(*str);
            }
        }
    }
    return out;
}

/**
 * @brief Reads non-negative integer keys, remembering the first one out of range.
 *
 * Absent keys leave the target untouched so defaults survive.
 */
class CountReader {
public:
    template <typename T>
    void read(const toml::node_view<toml::node>& section, std::string_view section_name,
              std::string_view key, T& target) {
        auto value = section[key].value<int64_t>();
        if (!value) return;
        if (*value < 0 || static_cast<uint64_t>(*value) > std::numeric_limits<T>::max()) {
            if (!error_) {
                error_ = Error{ErrorKind::InvalidArgument,
                               std::string{section_name} + "." + std::string{key} + " = "
                               + std::to_string(*value) + " is out of range"};
            }
            return;
        }
        target = static_cast<T>(*value);
    }

    [[nodiscard]] const std::optional<Error>& error() const noexcept { return error_; }

private:
    std::optional<Error> error_;
};

}  // anonymous namespace

std::map<Language, LanguageRuntimeConfig> default_language_runtimes() {
    return {
        {Language::Python,
         {.interpreter = "python3", .args = {"-u"}, .entry_file = "main.py",
          .env = {"PYTHONDONTWRITEBYTECODE=1", "PYTHONPATH=.deps"},
          .install = {"python3", "-m", "pip", "install", "--quiet", "--no-input",
                      "--target", ".deps", "-r", "requirements.txt"},
          .manifest = "requirements.txt",
          .memory_limit_mb = std::nullopt}},
        // V8 reserves far more address space than it uses; RLIMIT_AS would stop node starting.
        {Language::JavaScript,
         {.interpreter = "node", .args = {}, .entry_file = "index.js", .env = {},
          .install = {"npm", "install", "--no-audit", "--no-fund", "--omit=dev"},
          .manifest = "package.json",
          .memory_limit_mb = 0}},
        {Language::Ruby,
         {.interpreter = "ruby", .args = {}, .entry_file = "main.rb",
          .env = {"BUNDLE_PATH=.bundle"},
          .install = {"bundle", "install", "--quiet"},
          .manifest = "Gemfile",
          .memory_limit_mb = std::nullopt}},
    };
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config = default_config();
        CountReader counts;

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            counts.read(engine, "engine", "worker_count", config.engine.worker_count);
            counts.read(engine, "engine", "default_timeout_ms", config.engine.default_timeout_ms);
            counts.read(engine, "engine", "grace_period_ms", config.engine.grace_period_ms);
        }

        // [runner]
        if (auto runner = tbl["runner"]; runner.is_table()) {
            counts.read(runner, "runner", "output_limit_bytes", config.runner.output_limit_bytes);
            counts.read(runner, "runner", "poll_interval_ms", config.runner.poll_interval_ms);
            counts.read(runner, "runner", "install_timeout_ms", config.runner.install_timeout_ms);
        }

        // [monitor]
        if (auto monitor = tbl["monitor"]; monitor.is_table()) {
            counts.read(monitor, "monitor", "sampling_interval_ms",
                        config.monitor.sampling_interval_ms);
        }

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            config.sandbox.root_dir = sandbox["root_dir"].value_or(
                config.sandbox.root_dir.string());
            counts.read(sandbox, "sandbox", "max_sandboxes", config.sandbox.max_sandboxes);
            counts.read(sandbox, "sandbox", "disk_quota_mb", config.sandbox.disk_quota_mb);
            counts.read(sandbox, "sandbox", "inode_quota", config.sandbox.inode_quota);
            counts.read(sandbox, "sandbox", "max_processes", config.sandbox.max_processes);
            counts.read(sandbox, "sandbox", "memory_limit_mb", config.sandbox.memory_limit_mb);
            config.sandbox.isolate_namespaces = sandbox["isolate_namespaces"].value_or(true);
            config.sandbox.allow_network = sandbox["allow_network"].value_or(false);
        }

        // [storage]
        if (auto storage = tbl["storage"]; storage.is_table()) {
            counts.read(storage, "storage", "retry_attempts", config.storage.retry_attempts);
            counts.read(storage, "storage", "retry_backoff_ms", config.storage.retry_backoff_ms);
        }

        // [languages.<name>]
        if (auto languages = tbl["languages"]; languages.is_table()) {
            for (auto&& [key, node] : *languages.as_table()) {
                auto language = parse_language(key.str());
                if (!language) {
                    return Error{ErrorKind::InvalidArgument,
                                 "Unknown language section: languages." + std::string{key.str()}};
                }
                if (!node.is_table()) continue;

                auto section_name = "languages." + std::string{key.str()};
                auto view = toml::node_view<toml::node>{node};
                auto& runtime = config.languages[*language];
                runtime.interpreter = view["interpreter"].value_or(runtime.interpreter);
                runtime.entry_file = view["entry_file"].value_or(runtime.entry_file);
                runtime.manifest = view["manifest"].value_or(runtime.manifest);
                if (view["args"].is_array()) {
                    runtime.args = read_string_array(view["args"]);
                }
                if (view["env"].is_array()) {
                    runtime.env = read_string_array(view["env"]);
                }
                if (view["install"].is_array()) {
                    runtime.install = read_string_array(view["install"]);
                }
                if (view["memory_limit_mb"]) {
                    uint64_t limit = runtime.memory_limit_mb.value_or(config.sandbox.memory_limit_mb);
                    counts.read(view, section_name, "memory_limit_mb", limit);
                    runtime.memory_limit_mb = limit;
                }
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            counts.read(telemetry, "telemetry", "max_file_size_mb", config.telemetry.max_file_size_mb);
            counts.read(telemetry, "telemetry", "rotate_count", config.telemetry.rotate_count);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics_enabled = telemetry["metrics_enabled"].value_or(true);
        }

        if (counts.error()) {
            return *counts.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::InvalidArgument,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    Config config;
    config.languages = default_language_runtimes();
    return config;
}

}  // namespace exec_engine
