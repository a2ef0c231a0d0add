#include "chunkpack/config.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace chunkpack {

// Simple JSON parsing (minimal implementation without external deps)

namespace {

// Very simple JSON value extraction (flat objects of basic types)
class SimpleJson {
public:
    explicit SimpleJson(const std::string& json) : json_(json) {}

    std::string get_string(const std::string& key, const std::string& def = "") const {
        auto pos = value_pos(key);
        if (pos == std::string::npos || json_[pos] != '"') return def;

        std::string value;
        for (size_t i = pos + 1; i < json_.size(); ++i) {
            char c = json_[i];
            if (c == '"') return value;
            if (c == '\\') {
                if (++i == json_.size()) break;
                c = json_[i];
            }
            value.push_back(c);
        }
        return def;
    }

    uint64_t get_uint(const std::string& key, uint64_t def = 0) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos) return def;

        auto end = pos;
        while (end < json_.size() && std::isdigit(static_cast<unsigned char>(json_[end]))) ++end;

        if (end == pos) return def;
        return std::stoull(json_.substr(pos, end - pos));
    }

    bool get_bool(const std::string& key, bool def = false) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos) return def;

        if (json_.compare(pos, 4, "true") == 0) return true;
        if (json_.compare(pos, 5, "false") == 0) return false;
        return def;
    }

    SimpleJson get_object(const std::string& key) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos || json_[pos] != '{') return SimpleJson("{}");

        int depth = 1;
        bool in_string = false;
        size_t end = pos + 1;
        while (end < json_.size() && depth > 0) {
            char c = json_[end];
            if (in_string) {
                if (c == '\\') ++end;
                else if (c == '"') in_string = false;
            }
            else if (c == '"') in_string = true;
            else if (c == '{') ++depth;
            else if (c == '}') --depth;
            ++end;
        }

        return SimpleJson(json_.substr(pos, end - pos));
    }

private:
    std::string json_;

    // Position of the first non-blank character after `"key":`
    size_t value_pos(const std::string& key) const {
        auto pos = json_.find("\"" + key + "\"");
        if (pos == std::string::npos) return pos;

        pos = json_.find(':', pos);
        if (pos == std::string::npos) return pos;

        ++pos;
        while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos]))) ++pos;
        return pos < json_.size() ? pos : std::string::npos;
    }
};

// Quote a string value, escaping quotes and backslashes
std::string quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}  // namespace

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json(buffer.str());
}

Config Config::load_json(const std::string& json) {
    Config config;
    SimpleJson j(json);

    auto chunk = j.get_object("chunk");
    config.chunk.max_data_bytes = chunk.get_uint("max_data_bytes", config.chunk.max_data_bytes);

    auto storage = j.get_object("storage");
    auto storage_path = storage.get_string("path", "");
    if (!storage_path.empty()) {
        config.storage.path = storage_path;
    }
    config.storage.sync_writes = storage.get_bool("sync_writes", config.storage.sync_writes);

    auto logging = j.get_object("logging");
    config.logging.verbose = logging.get_bool("verbose", config.logging.verbose);

    return config;
}

void Config::save(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for writing: " + path.string());
    }
    file << to_json();
}

std::string Config::to_json() const {
    std::ostringstream oss;
    oss << "{\n";

    oss << "  \"chunk\": {\n";
    oss << "    \"max_data_bytes\": " << chunk.max_data_bytes << "\n";
    oss << "  },\n";

    oss << "  \"storage\": {\n";
    oss << "    \"path\": " << quote(storage.path.string()) << ",\n";
    oss << "    \"sync_writes\": " << (storage.sync_writes ? "true" : "false") << "\n";
    oss << "  },\n";

    oss << "  \"logging\": {\n";
    oss << "    \"verbose\": " << (logging.verbose ? "true" : "false") << "\n";
    oss << "  }\n";

    oss << "}\n";
    return oss.str();
}

Status Config::validate() const {
    if (chunk.max_data_bytes < MIN_CHUNK_MAX_SIZE) {
        return Status::error(ErrorCode::InvalidArgument,
                            "chunk.max_data_bytes must be at least " +
                            std::to_string(MIN_CHUNK_MAX_SIZE));
    }

    if (storage.path.empty()) {
        return Status::error(ErrorCode::InvalidArgument,
                            "storage.path must not be empty");
    }

    return Status::make_ok();
}

}  // namespace chunkpack
