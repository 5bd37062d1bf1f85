#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "adaptive_status.hpp"

using json = nlohmann::json;

/*
 * PERSISTABLE STATE
 *
 * Each adaptive component owns one JSON state file, wrapped in an envelope
 *   {"schema": <name>, "version": <n>, "state": {...}}
 * and written atomically (temp file + rename over the previous file), so a crash
 * leaves either the old or the new file on disk, never a half-written one.
 */
class Persistable {
public:
    Persistable(std::string schema, int version, std::string state_path);
    virtual ~Persistable() = default;

    // Writes the current state. On failure the in-memory state is untouched
    // and a STORAGE status is returned for the health signal.
    Status save() const;

    // Missing file: fresh defaults, success. Corrupt file or schema/version
    // mismatch: fresh defaults, STORAGE status (logged, never fatal).
    Status load();

    const std::string& state_path() const { return state_path_; }
    void set_state_path(const std::string& path) { state_path_ = path; }
    const std::string& schema() const { return schema_; }
    int schema_version() const { return version_; }

protected:
    virtual json to_state_json() const = 0;
    virtual void from_state_json(const json& state) = 0;
    virtual void reset_state() = 0;

private:
    std::string schema_;
    int version_;
    std::string state_path_;
};

// Atomic file replace used by Persistable::save(); exposed for tools.
Status write_file_atomic(const std::string& path, const std::string& contents);
