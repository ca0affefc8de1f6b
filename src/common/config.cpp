#include "config.hpp"
#include <climits>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <print>
#include <nlohmann/json.hpp>

namespace gridlite {

using json = nlohmann::json;

Result<Config> parse_config(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return fail(ErrorCode::InvalidArgument, "config is not a JSON object");
    }

    Config cfg;

    if (j.contains("database")) {
        if (!j["database"].is_string()) return fail(ErrorCode::InvalidArgument, "'database' must be a string");
        cfg.database = j["database"].get<std::string>();
    }

    if (j.contains("bucket")) {
        if (!j["bucket"].is_string()) return fail(ErrorCode::InvalidArgument, "'bucket' must be a string");
        cfg.bucket = j["bucket"].get<std::string>();
    }

    if (j.contains("chunk_size")) {
        if (!j["chunk_size"].is_number_integer()) return fail(ErrorCode::InvalidArgument, "'chunk_size' must be an integer");
        cfg.chunk_size = j["chunk_size"].get<int64_t>();
        if (cfg.chunk_size <= 0) return fail(ErrorCode::InvalidArgument, "'chunk_size' must be positive");
        if (cfg.chunk_size > INT_MAX) return fail(ErrorCode::InvalidArgument, "'chunk_size' is too large");
    }

    if (j.contains("digest")) {
        if (!j["digest"].is_string()) return fail(ErrorCode::InvalidArgument, "'digest' must be a string");
        auto alg = crypto::parse_algorithm(j["digest"].get<std::string>());
        if (!alg) return fail(ErrorCode::InvalidArgument, "unknown digest '" + j["digest"].get<std::string>() + "'");
        cfg.digest = *alg;
    }

    return cfg;
}

Result<Config> load_config(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return Config{};
    }

    std::ifstream in(path);
    if (!in.is_open()) return fail(ErrorCode::IOError, "cannot open config " + path);

    std::stringstream ss;
    ss << in.rdbuf();

    auto cfg = parse_config(ss.str());
    if (!cfg) {
        std::println(stderr, "[Config] {}: {}", path, cfg.error().message);
    }
    return cfg;
}

} // namespace gridlite
