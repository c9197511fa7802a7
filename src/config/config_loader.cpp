#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <string_view>
#include <unordered_set>

using namespace std::string_literals;

namespace hookrelay {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_in_node(toml::node& node) {
    if (node.is_string()) {
        auto& s = *node.as_string();
        auto expanded = expand_env_vars(s.get());
        if (expanded != s.get()) {
            s = std::move(expanded);
        }
    } else if (node.is_table()) {
        for (auto& [key, val] : *node.as_table()) {
            expand_env_vars_in_node(val);
        }
    } else if (node.is_array()) {
        expand_env_vars_in_array(*node.as_array());
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        expand_env_vars_in_node(elem);
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}; circular include?", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overlays it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    for (auto& [key, val] : result) {
        expand_env_vars_in_node(val);
    }
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    for (auto& [key, val] : result) {
        expand_env_vars_in_node(val);
    }
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

template <typename T>
T non_negative(const toml::node_view<const toml::node> node, const int64_t fallback) {
    const int64_t v = node.value_or(fallback);
    return static_cast<T>(v < 0 ? 0 : v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = static_cast<uint16_t>(s["port"].value_or(8080));
    cfg.thread_pool_size = non_negative<size_t>(s["threads"], 4);
    cfg.admin_token = s["admin_token"].value_or(""s);
    cfg.max_body_bytes = non_negative<size_t>(s["max_body_bytes"], 1024 * 1024);
    cfg.shutdown_timeout_ms = non_negative<uint32_t>(s["shutdown_timeout_ms"], 30000);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

StorageConfig ConfigLoader::extract_storage(const toml::table& root) {
    StorageConfig cfg;
    const auto* storage = root["storage"].as_table();
    if (!storage) return cfg;
    const auto& s = *storage;

    cfg.backend = utils::to_lower(s["backend"].value_or("memory"s));
    cfg.connection_string = s["connection_string"].value_or(""s);
    cfg.min_connections = non_negative<size_t>(s["min_connections"], 2);
    cfg.max_connections = non_negative<size_t>(s["max_connections"], 10);
    cfg.connection_timeout = std::chrono::milliseconds(
        non_negative<int64_t>(s["connection_timeout_ms"], 5000));
    return cfg;
}

IdempotencyConfig ConfigLoader::extract_idempotency(const toml::table& root) {
    IdempotencyConfig cfg;
    const auto* idem = root["idempotency"].as_table();
    if (!idem) return cfg;
    const auto& i = *idem;

    cfg.ttl_hours = non_negative<uint32_t>(i["ttl_hours"], 24);
    cfg.stale_lock_seconds = non_negative<uint32_t>(i["stale_lock_seconds"], 30);
    cfg.sweep_interval_seconds = non_negative<uint32_t>(i["sweep_interval_seconds"], 60);
    return cfg;
}

DeliveryConfig ConfigLoader::extract_delivery(const toml::table& root) {
    DeliveryConfig cfg;
    const auto* delivery = root["delivery"].as_table();
    if (!delivery) return cfg;
    const auto& d = *delivery;

    cfg.max_attempts = non_negative<uint32_t>(d["max_attempts"], 5);
    if (const auto* backoff = d["backoff_seconds"].as_array()) {
        cfg.backoff_seconds.clear();
        for (const auto& elem : *backoff) {
            if (auto v = elem.value<int64_t>()) {
                cfg.backoff_seconds.push_back(*v);
            }
        }
    }
    cfg.request_timeout = std::chrono::milliseconds(
        non_negative<int64_t>(d["request_timeout_ms"], 30000));
    cfg.poll_interval = std::chrono::milliseconds(
        non_negative<int64_t>(d["poll_interval_ms"], 1000));
    cfg.claim_batch_size = non_negative<size_t>(d["claim_batch_size"], 32);
    cfg.per_endpoint_concurrency = non_negative<uint32_t>(d["per_endpoint_concurrency"], 4);
    cfg.response_body_max_bytes = non_negative<size_t>(d["response_body_max_bytes"], 1024);
    cfg.disabled_recheck_seconds = non_negative<uint32_t>(d["disabled_recheck_seconds"], 60);
    cfg.in_flight_recovery_seconds = non_negative<uint32_t>(d["in_flight_recovery_seconds"], 120);
    cfg.require_https = d["require_https"].value_or(true);
    cfg.user_agent = d["user_agent"].value_or("hook-relay/1.0"s);

    // [delivery.queues] fresh = 4, retry = 2
    if (const auto* queues = d["queues"].as_table()) {
        cfg.queues.clear();
        for (const auto& [name, val] : *queues) {
            QueueConfig q;
            q.name = std::string(name.str());
            const int64_t concurrency = val.value_or(int64_t{0});
            q.concurrency = static_cast<uint32_t>(concurrency < 0 ? 0 : concurrency);
            cfg.queues.push_back(std::move(q));
        }
    }
    return cfg;
}

IncomingConfig ConfigLoader::extract_incoming(const toml::table& root) {
    IncomingConfig cfg;
    const auto* incoming = root["incoming"].as_table();
    if (!incoming) return cfg;
    const auto& in = *incoming;

    cfg.tolerance_seconds = non_negative<uint32_t>(in["tolerance_seconds"], 300);
    cfg.processing_threads = non_negative<uint32_t>(in["processing_threads"], 2);
    cfg.queue_capacity = non_negative<size_t>(in["queue_capacity"], 1024);
    cfg.recovery_interval_seconds = non_negative<uint32_t>(in["recovery_interval_seconds"], 30);
    cfg.processing_stale_seconds = non_negative<uint32_t>(in["processing_stale_seconds"], 300);

    const auto* sources = in["sources"].as_array();
    if (!sources) return cfg;
    cfg.sources.reserve(sources->size());

    for (const auto& elem : *sources) {
        const auto* src = elem.as_table();
        if (!src) continue;

        IncomingSource source;
        source.name = (*src)["name"].value_or(""s);
        source.secret = (*src)["secret"].value_or(""s);
        const auto scheme = (*src)["scheme"].value_or("timestamped_v1"s);
        if (!parse_signature_scheme(scheme, source.scheme)) {
            throw std::runtime_error(std::format(
                "incoming.sources '{}': unknown scheme '{}'", source.name, scheme));
        }
        source.signature_header = (*src)["signature_header"].value_or("X-Webhook-Signature"s);
        source.event_id_field = (*src)["event_id_field"].value_or("id"s);
        cfg.sources.push_back(std::move(source));
    }
    return cfg;
}

std::vector<UserConfig> ConfigLoader::extract_users(const toml::table& root) {
    std::vector<UserConfig> result;
    const auto* arr = root["users"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* user = elem.as_table();
        if (!user) continue;

        UserConfig cfg;
        cfg.name = (*user)["name"].value_or(""s);
        cfg.api_key = (*user)["api_key"].value_or(""s);
        result.push_back(std::move(cfg));
    }
    return result;
}

RelayConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    RelayConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.storage = extract_storage(tbl);
    config.idempotency = extract_idempotency(tbl);
    config.delivery = extract_delivery(tbl);
    config.incoming = extract_incoming(tbl);
    config.users = extract_users(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(RelayConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const RelayConfig& config) {
    std::vector<std::string> errors;

    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be at least 1");
    }

    const auto level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" && level != "warning"
        && level != "error") {
        errors.push_back(std::format("logging.level '{}' is not debug|info|warn|error",
                                     config.logging.level));
    }

    // ---- storage ----
    const auto& st = config.storage;
    if (st.backend != "memory" && st.backend != "postgresql") {
        errors.push_back(std::format("storage.backend '{}' is not memory|postgresql", st.backend));
    }
    if (st.backend == "postgresql") {
        if (st.connection_string.empty()) {
            errors.push_back("storage.connection_string required for the postgresql backend");
        }
        if (st.max_connections == 0) {
            errors.push_back("storage.max_connections must be at least 1");
        }
        if (st.min_connections > st.max_connections) {
            errors.push_back(std::format(
                "storage.min_connections ({}) > max_connections ({})",
                st.min_connections, st.max_connections));
        }
    }

    // ---- idempotency ----
    const auto& idem = config.idempotency;
    if (idem.ttl_hours == 0) {
        errors.push_back("idempotency.ttl_hours must be at least 1");
    }
    if (idem.stale_lock_seconds == 0) {
        errors.push_back("idempotency.stale_lock_seconds must be at least 1");
    }
    if (idem.sweep_interval_seconds == 0) {
        errors.push_back("idempotency.sweep_interval_seconds must be at least 1");
    }

    // ---- delivery ----
    const auto& d = config.delivery;
    if (d.max_attempts == 0) {
        errors.push_back("delivery.max_attempts must be at least 1");
    }
    if (d.backoff_seconds.empty()) {
        errors.push_back("delivery.backoff_seconds must not be empty");
    }
    for (size_t i = 0; i < d.backoff_seconds.size(); ++i) {
        if (d.backoff_seconds[i] < 0) {
            errors.push_back(std::format("delivery.backoff_seconds[{}] must not be negative", i));
        }
    }
    if (d.request_timeout.count() == 0) {
        errors.push_back("delivery.request_timeout_ms must be positive");
    }
    if (d.poll_interval.count() == 0) {
        errors.push_back("delivery.poll_interval_ms must be positive");
    }
    if (d.claim_batch_size == 0) {
        errors.push_back("delivery.claim_batch_size must be at least 1");
    }
    // A row can sit claimed in a lane's channel before its request starts
    const auto recovery_ms = static_cast<int64_t>(d.in_flight_recovery_seconds) * 1000;
    if (recovery_ms <= 2 * d.request_timeout.count()) {
        errors.push_back(std::format(
            "delivery.in_flight_recovery_seconds ({}) must exceed twice request_timeout_ms ({})",
            d.in_flight_recovery_seconds, d.request_timeout.count()));
    }
    // Each delivery status that becomes due needs a queue claiming it
    for (const char* required : {"fresh", "retry"}) {
        const bool present = std::any_of(d.queues.begin(), d.queues.end(),
            [required](const auto& q) { return q.name == required; });
        if (!present) {
            errors.push_back(std::format(
                "delivery.queues.{} is required; without it {} deliveries are never claimed",
                required, required == std::string_view("fresh") ? "pending" : "pending_retry"));
        }
    }
    for (const auto& q : d.queues) {
        if (q.name != "fresh" && q.name != "retry") {
            errors.push_back(std::format("delivery.queues.{} is not a known queue (fresh|retry)",
                                         q.name));
        }
        if (q.concurrency == 0) {
            errors.push_back(std::format("delivery.queues.{} concurrency must be at least 1",
                                         q.name));
        }
    }

    // ---- incoming ----
    const auto& in = config.incoming;
    if (in.processing_threads == 0) {
        errors.push_back("incoming.processing_threads must be at least 1");
    }
    if (in.queue_capacity == 0) {
        errors.push_back("incoming.queue_capacity must be at least 1");
    }
    if (in.recovery_interval_seconds == 0) {
        errors.push_back("incoming.recovery_interval_seconds must be at least 1");
    }
    if (in.processing_stale_seconds == 0) {
        errors.push_back("incoming.processing_stale_seconds must be at least 1");
    }
    std::unordered_set<std::string> source_names;
    for (size_t i = 0; i < in.sources.size(); ++i) {
        const auto& src = in.sources[i];
        if (src.name.empty()) {
            errors.push_back(std::format("incoming.sources[{}].name must not be empty", i));
        } else if (!source_names.insert(src.name).second) {
            errors.push_back(std::format("incoming.sources: duplicate name '{}'", src.name));
        }
        if (src.secret.empty()) {
            errors.push_back(std::format("incoming.sources[{}].secret must not be empty", i));
        }
        if (src.signature_header.empty()) {
            errors.push_back(std::format("incoming.sources[{}].signature_header must not be empty", i));
        }
        if (src.event_id_field.empty()) {
            errors.push_back(std::format("incoming.sources[{}].event_id_field must not be empty", i));
        }
    }

    // ---- users ----
    std::unordered_set<std::string> api_keys;
    for (size_t i = 0; i < config.users.size(); ++i) {
        const auto& u = config.users[i];
        if (u.name.empty()) {
            errors.push_back(std::format("users[{}].name must not be empty", i));
        }
        if (u.api_key.empty()) {
            errors.push_back(std::format("users[{}].api_key must not be empty", i));
        } else if (!api_keys.insert(u.api_key).second) {
            errors.push_back(std::format("users[{}].api_key is shared with another user", i));
        }
    }

    return errors;
}

} // namespace hookrelay
