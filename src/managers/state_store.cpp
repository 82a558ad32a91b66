#include "state_store.hpp"
#include "job_log.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>

StateStore::StateStore(fs::path dir)
    : dir_(std::move(dir)),
      state_path_(dir_ / "state.yaml"),
      prefs_path_(dir_ / "preferences.yaml") {
}

Result<void> write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Storage,
                                 "Cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Result<void>::Err(ErrorKind::Storage, "Cannot write " + tmp.string());
        }
        out << content;
        out.flush();
        if (!out) {
            return Result<void>::Err(ErrorKind::Storage, "Short write to " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err(ErrorKind::Storage, "Cannot replace " + path.string());
    }
    return Result<void>::Ok();
}

// ── Settings <-> YAML ───────────────────────────────────────

static void emit_settings(YAML::Emitter& out, const PrintSettings& s) {
    out << YAML::BeginMap;
    out << YAML::Key << "copies" << YAML::Value << s.copies;
    out << YAML::Key << "duplex" << YAML::Value << duplex_name(s.duplex);
    out << YAML::Key << "orientation" << YAML::Value << orientation_name(s.orientation);
    out << YAML::Key << "paper" << YAML::Value << paper_name(s.paper);
    out << YAML::Key << "pages_per_sheet" << YAML::Value << s.pages_per_sheet;
    out << YAML::Key << "page_range" << YAML::Value
        << (s.page_range.kind == PageRange::Kind::All ? "all" : s.page_range.to_string());
    out << YAML::EndMap;
}

static PrintSettings parse_settings(const YAML::Node& n) {
    PrintSettings s;
    if (!n || !n.IsMap()) return s;
    s.copies = n["copies"].as<int>(1);
    s.duplex = parse_duplex(n["duplex"].as<std::string>("none")).value_or(DuplexMode::Simplex);
    s.orientation = parse_orientation(n["orientation"].as<std::string>("portrait"))
                        .value_or(Orientation::Portrait);
    s.paper = parse_paper(n["paper"].as<std::string>("A4")).value_or(PaperSize::A4);
    s.pages_per_sheet = n["pages_per_sheet"].as<int>(1);
    auto range = parse_page_range(n["page_range"].as<std::string>("all"));
    if (range.is_ok()) s.page_range = range.value;
    return s;
}

static void emit_optional(YAML::Emitter& out, const char* key, const std::optional<std::string>& v) {
    if (v) out << YAML::Key << key << YAML::Value << *v;
}

static std::optional<std::string> optional_string(const YAML::Node& n) {
    if (!n || n.IsNull()) return std::nullopt;
    return n.as<std::string>();
}

// ── State ───────────────────────────────────────────────────

Result<PersistedState> StateStore::load() const {
    PersistedState state;
    if (!fs::exists(state_path_)) {
        return Result<PersistedState>::Ok(state);
    }

    try {
        YAML::Node root = YAML::LoadFile(state_path_.string());
        if (!root || root.IsNull()) {
            return Result<PersistedState>::Ok(state);
        }

        if (root["jobs"] && root["jobs"].IsSequence()) {
            for (const auto& n : root["jobs"]) {
                PrintJob j;
                j.id = n["id"].as<std::string>("");
                if (j.id.empty()) continue;
                j.name = n["name"].as<std::string>("");
                j.source_path = n["source_path"].as<std::string>("");
                j.queue = n["queue"].as<std::string>("");
                j.settings = parse_settings(n["settings"]);
                j.status = parse_job_status(n["status"].as<std::string>("")).value_or(JobStatus::Failed);
                j.remote_id = optional_string(n["remote_id"]);
                j.error = optional_string(n["error"]);
                j.staged_path = optional_string(n["staged_path"]);
                j.created_at = n["created_at"].as<std::string>("");
                j.updated_at = n["updated_at"].as<std::string>(j.created_at);
                j.copy_index = n["copy_index"].as<int>(0);
                state.jobs.push_back(j);
            }
        }

        if (root["drafts"] && root["drafts"].IsSequence()) {
            for (const auto& n : root["drafts"]) {
                DraftJob d;
                d.source_path = n["source_path"].as<std::string>("");
                if (d.source_path.empty()) continue;
                d.queue = n["queue"].as<std::string>("");
                d.settings = parse_settings(n["settings"]);
                d.updated_at = n["updated_at"].as<std::string>("");
                state.drafts.push_back(d);
            }
        }

        if (root["connection"] && root["connection"].IsMap()) {
            const auto& n = root["connection"];
            ConnectionConfig c;
            c.host = n["host"].as<std::string>("");
            c.port = n["port"].as<int>(22);
            c.user = n["user"].as<std::string>("");
            c.auth = parse_auth_method(n["auth"].as<std::string>("password")).value_or(AuthMethod::Password);
            c.key_path = n["key_path"].as<std::string>("");
            c.timeout = n["timeout"].as<int>(c.timeout);
            if (!c.host.empty()) state.last_connection = c;
        }
    } catch (const YAML::Exception& e) {
        return Result<PersistedState>::Err(ErrorKind::Storage,
                                           "Corrupt " + state_path_.string() + ": " + e.what());
    }

    return Result<PersistedState>::Ok(state);
}

Result<void> StateStore::save(const PersistedState& state) const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "jobs" << YAML::Value << YAML::BeginSeq;
    for (const auto& j : state.jobs) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << j.id;
        out << YAML::Key << "name" << YAML::Value << j.name;
        out << YAML::Key << "source_path" << YAML::Value << j.source_path;
        out << YAML::Key << "queue" << YAML::Value << j.queue;
        out << YAML::Key << "settings" << YAML::Value;
        emit_settings(out, j.settings);
        out << YAML::Key << "status" << YAML::Value << job_status_name(j.status);
        emit_optional(out, "remote_id", j.remote_id);
        emit_optional(out, "error", j.error);
        emit_optional(out, "staged_path", j.staged_path);
        out << YAML::Key << "created_at" << YAML::Value << j.created_at;
        out << YAML::Key << "updated_at" << YAML::Value << j.updated_at;
        if (j.copy_index > 0) {
            out << YAML::Key << "copy_index" << YAML::Value << j.copy_index;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "drafts" << YAML::Value << YAML::BeginSeq;
    for (const auto& d : state.drafts) {
        out << YAML::BeginMap;
        out << YAML::Key << "source_path" << YAML::Value << d.source_path;
        out << YAML::Key << "queue" << YAML::Value << d.queue;
        out << YAML::Key << "settings" << YAML::Value;
        emit_settings(out, d.settings);
        out << YAML::Key << "updated_at" << YAML::Value << d.updated_at;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    if (state.last_connection) {
        const auto& c = *state.last_connection;
        out << YAML::Key << "connection" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << c.host;
        out << YAML::Key << "port" << YAML::Value << c.port;
        out << YAML::Key << "user" << YAML::Value << c.user;
        out << YAML::Key << "auth" << YAML::Value << auth_method_name(c.auth);
        out << YAML::Key << "key_path" << YAML::Value << c.key_path;
        out << YAML::Key << "timeout" << YAML::Value << c.timeout;
        out << YAML::EndMap;
    }

    out << YAML::EndMap;
    return write_file_atomic(state_path_, std::string(out.c_str()) + "\n");
}

// ── Preferences ─────────────────────────────────────────────

Result<Preferences> StateStore::load_preferences() const {
    Preferences prefs;
    if (!fs::exists(prefs_path_)) {
        return Result<Preferences>::Ok(prefs);
    }
    try {
        YAML::Node root = YAML::LoadFile(prefs_path_.string());
        if (root && root.IsMap()) {
            prefs.default_queue = root["default_queue"].as<std::string>("");
        }
    } catch (const YAML::Exception& e) {
        return Result<Preferences>::Err(ErrorKind::Storage,
                                        "Corrupt " + prefs_path_.string() + ": " + e.what());
    }
    return Result<Preferences>::Ok(prefs);
}

Result<void> StateStore::save_preferences(const Preferences& prefs) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "default_queue" << YAML::Value << prefs.default_queue;
    out << YAML::EndMap;
    return write_file_atomic(prefs_path_, std::string(out.c_str()) + "\n");
}

// ── Backups ─────────────────────────────────────────────────

fs::path StateStore::backup_dir(const std::string& job_id) const {
    return dir_ / "backups" / job_id;
}

Result<fs::path> StateStore::backup_source(const std::string& job_id, const fs::path& source) const {
    std::error_code ec;
    fs::path dir = backup_dir(job_id);
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<fs::path>::Err(ErrorKind::Storage, "Cannot create " + dir.string());
    }
    fs::path dest = dir / source.filename();
    fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<fs::path>::Err(ErrorKind::Storage,
                                     "Backup of " + source.string() + " failed: " + ec.message());
    }
    return Result<fs::path>::Ok(dest);
}

void StateStore::remove_backup(const std::string& job_id) const {
    std::error_code ec;
    fs::remove_all(backup_dir(job_id), ec);
    if (ec) {
        socprint_log("state: could not remove backup for " + job_id + ": " + ec.message());
    }
}
