#include <iostream>
#include <print>
#include <string>
#include <vector>
#include <format>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <optional>

// Internal Headers
#include "../common/config.hpp"
#include "../common/db.hpp"
#include "../grid/bucket.hpp"

namespace fs = std::filesystem;

// --- Helpers ---

static void usage() {
    std::println(stderr, "usage: gridctl [--config FILE] [--db PATH] [--bucket NAME] <command> [args]");
    std::println(stderr, "commands:");
    std::println(stderr, "  put <file> [name]              upload a file, prints its id");
    std::println(stderr, "  get <id> <out>                 download by id");
    std::println(stderr, "  get-name <name> <out> [rev]    download by filename (rev -1 = newest)");
    std::println(stderr, "  cat <id>                       write file contents to stdout");
    std::println(stderr, "  ls                             list stored files");
    std::println(stderr, "  info <id>                      show the file record");
    std::println(stderr, "  rm <id>                        delete a file and its chunks");
    std::println(stderr, "  rename <id> <name>             change a file's name");
    std::println(stderr, "  verify <id>                    recompute and compare the digest");
}

static int report(const gridlite::Error& err) {
    std::println(stderr, "[gridctl] {}: {}", gridlite::to_string(err.code), err.message);
    return 1;
}

static std::string format_date(std::optional<int64_t> ms) {
    if (!ms) return "-";
    auto tp = std::chrono::sys_time<std::chrono::milliseconds>(std::chrono::milliseconds(*ms));
    return std::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::floor<std::chrono::seconds>(tp));
}

static gridlite::json record_to_json(const gridlite::FileRecord& rec) {
    gridlite::json j;
    j["_id"] = rec.id;
    j["filename"] = rec.filename ? gridlite::json(*rec.filename) : gridlite::json(nullptr);
    j["chunkSize"] = rec.chunk_size;
    j["length"] = rec.length_or_zero();
    j["uploadDate"] = rec.upload_date ? gridlite::json(*rec.upload_date) : gridlite::json(nullptr);
    j["digest"] = rec.digest ? gridlite::json(*rec.digest) : gridlite::json(nullptr);
    if (rec.content_type) j["contentType"] = *rec.content_type;
    if (rec.aliases) j["aliases"] = *rec.aliases;
    if (!rec.metadata.is_null()) j["metadata"] = rec.metadata;
    for (const auto& [key, value] : rec.extra.items()) j[key] = value;
    return j;
}

// --- Main ---

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // 1. Global options
    std::string config_path = "gridlite.json";
    std::optional<std::string> db_override;
    std::optional<std::string> bucket_override;

    size_t i = 0;
    while (i < args.size() && args[i].starts_with("--")) {
        if (i + 1 >= args.size()) { usage(); return 1; }
        if (args[i] == "--config") config_path = args[i + 1];
        else if (args[i] == "--db") db_override = args[i + 1];
        else if (args[i] == "--bucket") bucket_override = args[i + 1];
        else { usage(); return 1; }
        i += 2;
    }
    if (i >= args.size()) { usage(); return 1; }

    const std::string cmd = args[i];
    std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());

    // 2. Configuration
    auto cfg = gridlite::load_config(config_path);
    if (!cfg) return report(cfg.error());
    if (db_override) cfg->database = *db_override;
    if (bucket_override) cfg->bucket = *bucket_override;

    // 3. Store
    gridlite::Database db;
    if (!db.open(cfg->database, cfg->bucket)) {
        std::println(stderr, "[gridctl] Fatal: failed to open {}", cfg->database);
        return 1;
    }

    gridlite::Bucket bucket(db, gridlite::BucketOptions{cfg->chunk_size, cfg->digest});

    // 4. Dispatch
    if (cmd == "put" && (rest.size() == 1 || rest.size() == 2)) {
        std::ifstream in(rest[0], std::ios::binary);
        if (!in.is_open()) {
            std::println(stderr, "[gridctl] Cannot open {}", rest[0]);
            return 1;
        }
        std::string name = rest.size() == 2 ? rest[1] : fs::path(rest[0]).filename().string();

        auto id = bucket.upload_from_stream(name, in);
        if (!id) return report(id.error());
        std::println("{}", *id);
        return 0;
    }

    if (cmd == "get" && rest.size() == 2) {
        std::ofstream out(rest[1], std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::println(stderr, "[gridctl] Cannot create {}", rest[1]);
            return 1;
        }
        if (auto res = bucket.download_to_stream(rest[0], out); !res) return report(res.error());
        return 0;
    }

    if (cmd == "get-name" && (rest.size() == 2 || rest.size() == 3)) {
        int revision = -1;
        if (rest.size() == 3) {
            try {
                revision = std::stoi(rest[2]);
            } catch (const std::exception&) {
                std::println(stderr, "[gridctl] Bad revision '{}'", rest[2]);
                return 1;
            }
        }
        std::ofstream out(rest[1], std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::println(stderr, "[gridctl] Cannot create {}", rest[1]);
            return 1;
        }
        if (auto res = bucket.download_to_stream_by_name(rest[0], out, revision); !res) return report(res.error());
        return 0;
    }

    if (cmd == "cat" && rest.size() == 1) {
        auto reader = bucket.open_download_stream(rest[0]);
        if (!reader) return report(reader.error());

        // Sequential read through the cursor, chunk by chunk
        while (true) {
            auto data = reader->read_chunk();
            if (!data) return report(data.error());
            if (data->empty()) break;
            std::cout.write(reinterpret_cast<const char*>(data->data()), static_cast<std::streamsize>(data->size()));
        }
        std::cout.flush();
        return 0;
    }

    if (cmd == "ls" && rest.empty()) {
        auto files = db.find_files(gridlite::FileQuery{});
        if (!files) {
            std::println(stderr, "[gridctl] Query failed");
            return 1;
        }
        for (const auto& f : *files) {
            std::println("{}  {:>12}  {}  {}", f.id, f.length_or_zero(), format_date(f.upload_date),
                         f.filename.value_or("-"));
        }
        return 0;
    }

    if (cmd == "info" && rest.size() == 1) {
        auto reader = bucket.open_download_stream(rest[0]);
        if (!reader) return report(reader.error());
        auto rec = reader->record();
        if (!rec) return report(rec.error());
        std::println("{}", record_to_json(*rec).dump(2));
        return 0;
    }

    if (cmd == "rm" && rest.size() == 1) {
        if (auto res = bucket.remove(rest[0]); !res) return report(res.error());
        return 0;
    }

    if (cmd == "rename" && rest.size() == 2) {
        if (auto res = bucket.rename(rest[0], rest[1]); !res) return report(res.error());
        return 0;
    }

    if (cmd == "verify" && rest.size() == 1) {
        auto ok = bucket.verify(rest[0]);
        if (!ok) return report(ok.error());
        std::println("{}", *ok ? "OK" : "MISMATCH");
        return *ok ? 0 : 1;
    }

    usage();
    return 1;
}
