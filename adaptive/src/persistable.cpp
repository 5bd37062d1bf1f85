#include "persistable.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

Persistable::Persistable(std::string schema, int version, std::string state_path)
    : schema_(std::move(schema)), version_(version), state_path_(std::move(state_path)) {}

Status write_file_atomic(const std::string& path, const std::string& contents) {
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Status::error(ErrorKind::STORAGE,
                "cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            return Status::error(ErrorKind::STORAGE, "cannot open " + tmp_path + " for writing");
        }
        out << contents;
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tmp_path, ec);
            return Status::error(ErrorKind::STORAGE, "write failed for " + tmp_path);
        }
    }

    fs::rename(tmp_path, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        return Status::error(ErrorKind::STORAGE, "rename to " + path + " failed: " + ec.message());
    }
    return Status::success();
}

Status Persistable::save() const {
    json envelope;
    envelope["schema"] = schema_;
    envelope["version"] = version_;
    envelope["state"] = to_state_json();

    Status status = write_file_atomic(state_path_, envelope.dump(2));
    if (!status.ok()) {
        std::cerr << "❌ Failed to save " << schema_ << " state: " << status.message << std::endl;
    }
    return status;
}

Status Persistable::load() {
    std::ifstream file(state_path_);
    if (!file.good()) {
        reset_state();
        return Status::success();
    }

    try {
        json envelope;
        file >> envelope;

        std::string schema = envelope.value("schema", std::string());
        int version = envelope.value("version", 0);
        if (schema != schema_ || version != version_) {
            std::cerr << "⚠️ " << state_path_ << " has schema " << schema << " v" << version
                      << " (expected " << schema_ << " v" << version_ << "), starting fresh" << std::endl;
            reset_state();
            return Status::error(ErrorKind::STORAGE, "schema mismatch in " + state_path_);
        }

        reset_state();
        from_state_json(envelope.at("state"));
    } catch (const json::exception& e) {
        std::cerr << "⚠️ Corrupt state file " << state_path_ << ": " << e.what()
                  << ", starting fresh" << std::endl;
        reset_state();
        return Status::error(ErrorKind::STORAGE, e.what());
    }
    return Status::success();
}
